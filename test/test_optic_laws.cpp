// test_optic_laws.cpp - Generated optics checked against the optic laws
// Plans are executed by the runtime interpreter on dynamic objects

#include <catch2/catch_all.hpp>
#include <opticsgen/navigator.h>
#include <opticsgen/optics_generator.h>
#include <opticsgen/runtime/interpreter.h>

#include "test_fixtures.h"

#include <map>

using namespace opticsgen;
using namespace opticsgen::runtime;
using namespace fixtures;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Object street(std::string name, int number)
{
    return Object::record("demo::Street", {{"name", std::move(name)}, {"number", number}});
}

Object address(Object s, std::string city)
{
    return Object::record("demo::Address", {{"street", std::move(s)}, {"city", std::move(city)}});
}

Object create_person()
{
    return Object::record("demo::Person", {
        {"name", "Ada"},
        {"age", 36},
        {"tags", Object::list({"math", "engines"})},
        {"nickname", Object{}},
        {"address", address(street("Baker", 221), "London")},
    });
}

Object create_company()
{
    return Object::record("demo::Company", {
        {"name", "Analytical"},
        {"address", address(street("Strand", 1), "London")},
        {"employees", Object::list({create_person()})},
        {"offices", Object::map({{"hq", address(street("Strand", 1), "London")}})},
    });
}

struct LawFixture {
    TypeRegistry types = demo_registry();
    TypeShapeAnalyser analyser{types};
    OpticsGenerator generator{types};
    Interpreter interpreter{types};

    GeneratedClass load(const std::string& type_name, GeneratorOptions options = {})
    {
        auto generated = generator.generate(analyser.analyse(*types.find(type_name)), options);
        interpreter.add_class(generated);
        return generated;
    }

    GeneratedClass load_spec(const TypeDecl& spec)
    {
        types.add(spec);
        SpecAnalyser specs{types};
        auto generated = generator.generate_spec(specs.analyse(spec), GeneratorOptions{});
        interpreter.add_class(generated);
        return generated;
    }
};

} // namespace

// ============================================================
// Lens laws
// ============================================================

TEST_CASE_METHOD(LawFixture, "record lenses satisfy the lens laws", "[laws][lens]") {
    load("demo::Person");
    const auto person = create_person();

    const std::map<std::string, std::pair<Object, Object>> replacements{
        {"name", {"Grace", "Alan"}},
        {"age", {37, 41}},
        {"tags", {Object::list({}), Object::list({"logic"})}},
        {"nickname", {"Countess", Object{}}},
        {"address", {address(street("Downing", 10), "London"), address(street("Main", 3), "Boston")}},
    };

    auto field = GENERATE("name", "age", "tags", "nickname", "address");
    auto lens = interpreter.lens("demo::PersonLenses", field);
    const auto& [a, b] = replacements.at(field);

    SECTION("get-set") {
        REQUIRE(lager::set(lens, person, lager::view(lens, person)) == person);
    }

    SECTION("set-get") {
        REQUIRE(lager::view(lens, lager::set(lens, person, a)) == a);
    }

    SECTION("set-set") {
        REQUIRE(lager::set(lens, lager::set(lens, person, a), b) == lager::set(lens, person, b));
    }

    SECTION("other fields are untouched") {
        auto updated = lager::set(lens, person, a);
        for (const auto& [other, unused] : replacements) {
            if (other != field) {
                REQUIRE(updated.field(other) == person.field(other));
            }
        }
    }
}

TEST_CASE_METHOD(LawFixture, "wither lenses satisfy the lens laws", "[laws][lens][wither]") {
    load("demo::Money");
    const auto money = Object::record("demo::Money", {{"amount", 12.5}, {"currency", "EUR"}});

    auto amount = interpreter.lens("demo::MoneyLenses", "amount");
    auto currency = interpreter.lens("demo::MoneyLenses", "currency");

    REQUIRE(lager::view(amount, money) == Object{12.5});
    REQUIRE(lager::view(currency, money) == Object{"EUR"});
    REQUIRE(lager::set(currency, money, lager::view(currency, money)) == money);
    REQUIRE(lager::view(currency, lager::set(currency, money, Object{"GBP"})) == Object{"GBP"});
    REQUIRE(lager::set(amount, lager::set(amount, money, Object{1.0}), Object{2.0}) == lager::set(amount, money, Object{2.0}));
}

TEST_CASE_METHOD(LawFixture, "with-updaters set through the field lens", "[laws][updater]") {
    auto generated = load("demo::Person");
    const auto* with_age = generated.find_as<UpdaterMember>("withAge");
    REQUIRE(with_age != nullptr);

    auto older = interpreter.update(*with_age, create_person(), 40);
    REQUIRE(older.field("age") == Object{40});
    REQUIRE(older.field("name") == Object{"Ada"});
}

// ============================================================
// Prism laws
// ============================================================

TEST_CASE_METHOD(LawFixture, "variant prisms satisfy the prism laws", "[laws][prism]") {
    load("demo::Shape");
    auto circle = interpreter.prism(Expr{OpticRef{"demo::ShapePrisms", "circle"}});

    const auto c = Object::record("demo::Circle", {{"radius", 2.0}});
    const auto s = Object::record("demo::Square", {{"side", 3.0}});

    SECTION("review then preview") {
        REQUIRE(circle.preview(circle.review(c)) == std::optional<Object>{c});
    }

    SECTION("preview then review") {
        auto part = circle.preview(c);
        REQUIRE(part.has_value());
        REQUIRE(circle.review(*part) == c);
    }

    SECTION("non-matching variant") {
        REQUIRE_FALSE(circle.preview(s).has_value());
    }
}

TEST_CASE_METHOD(LawFixture, "each of three variant prisms matches only its own variant", "[laws][prism]") {
    TypeDecl vehicle;
    vehicle.qualified_name = "demo::Vehicle";
    vehicle.kind = DeclKind::Interface;
    vehicle.sealed = true;
    vehicle.permitted_subtypes = {demo("Car"), demo("Bike"), demo("Boat")};
    types.add(vehicle)
        .add(record("demo::Car", {{"doors", int_type()}}, {demo("Vehicle")}))
        .add(record("demo::Bike", {{"gears", int_type()}}, {demo("Vehicle")}))
        .add(record("demo::Boat", {{"sails", int_type()}}, {demo("Vehicle")}));

    auto generated = load("demo::Vehicle");
    REQUIRE(generated.members.size() == 3);

    const std::map<std::string, Object> values{
        {"car", Object::record("demo::Car", {{"doors", 4}})},
        {"bike", Object::record("demo::Bike", {{"gears", 21}})},
        {"boat", Object::record("demo::Boat", {{"sails", 2}})},
    };
    for (const auto& [member, _] : values) {
        auto prism = interpreter.prism(Expr{OpticRef{"demo::VehiclePrisms", member}});
        for (const auto& [variant, value] : values) {
            if (variant == member) {
                REQUIRE(prism.preview(value) == std::optional<Object>{value});
            } else {
                REQUIRE_FALSE(prism.preview(value).has_value());
            }
        }
    }
}

TEST_CASE_METHOD(LawFixture, "enum constant prisms match exactly one constant", "[laws][prism][enum]") {
    load("demo::Color");
    auto constant = GENERATE("RED", "DARK_BLUE", "GREEN");
    const auto value = Object::enumeration("demo::Color", constant);

    for (const auto& [member, name] : std::map<std::string, std::string>{
             {"red", "RED"}, {"darkBlue", "DARK_BLUE"}, {"green", "GREEN"}}) {
        auto prism = interpreter.prism(Expr{OpticRef{"demo::ColorPrisms", member}});
        REQUIRE(prism.preview(value).has_value() == (name == constant));
        REQUIRE(prism.preview(prism.review(value)) == std::optional<Object>{value});
    }
}

// ============================================================
// Traversals
// ============================================================

TEST_CASE_METHOD(LawFixture, "container traversals reach every element", "[laws][traversal]") {
    load("demo::Person");
    const auto person = create_person();
    auto upper = [](const Object& o) { return Object{*o.get_if<std::string>() + "!"}; };

    SECTION("list") {
        auto tags = interpreter.traversal(Expr{OpticRef{"demo::PersonLenses", "tagsTraversal"}});
        REQUIRE(tags.get_all(person) == std::vector<Object>{"math", "engines"});

        auto updated = tags.modify(person, upper);
        REQUIRE(updated.field("tags") == Object::list({"math!", "engines!"}));
        REQUIRE(updated.field("name") == person.field("name"));
    }

    SECTION("identity modify leaves the source unchanged") {
        auto tags = interpreter.traversal(Expr{OpticRef{"demo::PersonLenses", "tagsFold"}});
        REQUIRE(tags.modify(person, [](const Object& o) { return o; }) == person);
    }

    SECTION("empty optional has no focus") {
        auto nickname = interpreter.traversal(Expr{OpticRef{"demo::PersonLenses", "nicknameTraversal"}});
        REQUIRE(nickname.get_all(person).empty());
        REQUIRE(nickname.modify(person, upper) == person);

        auto named = person.with_field("nickname", "Countess");
        REQUIRE(nickname.get_all(named) == std::vector<Object>{"Countess"});
    }

    SECTION("map values") {
        load("demo::Company");
        auto offices = interpreter.traversal(Expr{OpticRef{"demo::CompanyLenses", "officesTraversal"}});
        REQUIRE(offices.get_all(create_company()).size() == 1);
    }
}

// ============================================================
// Navigator paths
// ============================================================

TEST_CASE_METHOD(LawFixture, "navigator paths compose field lenses", "[laws][navigator]") {
    NavigatorComposer composer{types, analyser};
    GeneratorOptions options;
    options.max_navigator_depth = 2;
    auto focus = composer.compose(analyser.analyse(*types.find("demo::Company")), options);

    const auto* address = focus.find_as<NavigatorClass>("AddressNavigator");
    REQUIRE(address != nullptr);
    const auto* street_nav = address->find_navigator("StreetNavigator");
    REQUIRE(street_nav != nullptr);
    const auto* number = street_nav->find_accessor("number");
    REQUIRE(number != nullptr);

    auto path = interpreter.lens(number->path);
    const auto company = create_company();

    REQUIRE(lager::view(path, company) == Object{1});

    auto moved = lager::set(path, company, Object{42});
    REQUIRE(lager::view(path, moved) == Object{42});
    REQUIRE(moved.field("address").field("city") == Object{"London"});
    REQUIRE(moved.field("name") == company.field("name"));

    SECTION("the delegate of a navigator views the navigated record") {
        auto delegate = interpreter.lens(street_nav->delegate);
        REQUIRE(lager::view(delegate, company) == street("Strand", 1));
    }

    SECTION("list accessors traverse elements through the path") {
        const auto* employees = focus.find_as<FocusAccessor>("employees");
        auto each = interpreter.traversal(employees->path);
        REQUIRE(each.get_all(company) == std::vector<Object>{create_person()});
    }
}

// ============================================================
// Spec strategies at runtime
// ============================================================

TEST_CASE_METHOD(LawFixture, "spec lenses run every copy strategy", "[laws][spec]") {
    load_spec(spec_interface("demo::PersonOpticsSpec", demo("Person"), {
        optic_method("name", "Lens", demo("Person"), string_type(), {annotation("ViaBuilder")}),
        optic_method("age", "Lens", demo("Person"), int_type(), {annotation("Wither")}),
        optic_method("tags", "Lens", demo("Person"), vector_of(string_type()),
                     {annotation("ViaCopyAndSet")}),
        optic_method("eachTag", "Traversal", demo("Person"), string_type(),
                     {annotation("ThroughField", {{"field", std::string{"tags"}}})}),
    }));
    const auto person = create_person();

    auto strategy = GENERATE(std::string{"name"}, std::string{"age"}, std::string{"tags"});
    const std::map<std::string, Object> values{{"name", "Grace"}, {"age", 50}, {"tags", Object::list({"a"})}};

    auto lens = interpreter.lens("demo::PersonOptics", strategy);
    const auto& value = values.at(strategy);
    REQUIRE(lager::view(lens, lager::set(lens, person, value)) == value);
    REQUIRE(lager::set(lens, person, lager::view(lens, person)) == person);

    SECTION("builders are closed again") {
        REQUIRE_FALSE(lager::set(lens, person, value).get_if<Record>()->builder);
    }

    SECTION("through-field traversal uses the spec lens") {
        auto each = interpreter.traversal(Expr{OpticRef{"demo::PersonOptics", "eachTag"}});
        REQUIRE(each.get_all(person).size() == 2);
    }
}

TEST_CASE_METHOD(LawFixture, "copy and set copies into the named copy type", "[laws][spec][copy]") {
    types.add(plain_class("demo::PersonDraft"));
    interpreter.define_method("demo::PersonDraft", "assignName", [](const Object& self, const std::vector<Object>& args) {
        return self.with_field("name", args.front());
    });
    load_spec(spec_interface("demo::PersonOpticsSpec", demo("Person"), {
        optic_method("name", "Lens", demo("Person"), string_type(),
                     {annotation("ViaCopyAndSet", {{"copyConstructor", std::string{"demo::PersonDraft"}},
                                                   {"setter", std::string{"assignName"}}})}),
    }));

    auto lens = interpreter.lens("demo::PersonOptics", "name");
    auto draft = lager::set(lens, create_person(), Object{"Grace"});
    REQUIRE(draft.type_name() == "demo::PersonDraft");
    REQUIRE(draft.field("name") == Object{"Grace"});
    REQUIRE(draft.field("age") == Object{36});

    SECTION("an undeclared copy type is refused") {
        load_spec(spec_interface("demo::StreetOpticsSpec", demo("Street"), {
            optic_method("name", "Lens", demo("Street"), string_type(),
                         {annotation("ViaCopyAndSet", {{"copyConstructor", std::string{"demo::Missing"}}})}),
        }));
        auto street_name = interpreter.lens("demo::StreetOptics", "name");
        REQUIRE_THROWS_WITH(lager::set(street_name, street("Baker", 221), Object{"Main"}),
                            Catch::Matchers::ContainsSubstring("no copy constructor demo::Missing"));
    }
}

TEST_CASE_METHOD(LawFixture, "user methods take precedence and prisms can call them", "[laws][methods]") {
    interpreter.define_method("demo::Money", "isPositive", [](const Object& self, const std::vector<Object>&) {
        return Object{*self.field("amount").get_if<double>() > 0.0};
    });
    load_spec(spec_interface("demo::MoneyOpticsSpec", demo("Money"), {
        optic_method("positive", "Prism", demo("Money"), double_type(),
                     {annotation("MatchWhen", {{"predicate", std::string{"isPositive"}},
                                               {"getter", std::string{"amount"}}})}),
    }));

    auto positive = interpreter.prism(Expr{OpticRef{"demo::MoneyOptics", "positive"}});
    REQUIRE(positive.preview(Object::record("demo::Money", {{"amount", 5.0}})) == std::optional<Object>{Object{5.0}});
    REQUIRE_FALSE(positive.preview(Object::record("demo::Money", {{"amount", -5.0}})).has_value());
}

TEST_CASE_METHOD(LawFixture, "placeholder setters raise only when invoked", "[laws][unsupported]") {
    load_spec(spec_interface("demo::StreetOpticsSpec", demo("Street"), {
        optic_method("number", "Lens", demo("Street"), int_type(), {annotation("ViaConstructor")}),
    }));
    auto lens = interpreter.lens("demo::StreetOptics", "number");
    const auto s = street("Baker", 221);

    REQUIRE(lager::view(lens, s) == Object{221});
    REQUIRE_THROWS_AS(lager::set(lens, s, Object{7}), UnsupportedOperation);
}
