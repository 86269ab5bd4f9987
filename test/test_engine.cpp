// test_engine.cpp - Tests for the generation pass
// Request dispatch, per-request error isolation and once-per-name writes

#include <catch2/catch_all.hpp>
#include <opticsgen/code_printer.h>
#include <opticsgen/diagnostics.h>
#include <opticsgen/engine.h>

#include "test_fixtures.h"

#include <iostream>
#include <sstream>

using namespace opticsgen;
using namespace fixtures;
using Catch::Matchers::ContainsSubstring;

namespace {

GenerationRequest optics(std::string type_name)
{
    return GenerationRequest{std::move(type_name), RequestKind::Optics, {}};
}

GenerationRequest focus(std::string type_name)
{
    return GenerationRequest{std::move(type_name), RequestKind::Focus, {}};
}

} // namespace

TEST_CASE("a pass writes one class per request", "[engine]") {
    auto types = demo_registry();
    MemoryCodeSink sink;
    Engine engine{types, sink};

    auto report = engine.run({optics("demo::Person"), optics("demo::Shape"), optics("demo::Color"),
                              focus("demo::Company")});

    REQUIRE(report.ok());
    REQUIRE(report.generated.size() == 4);
    REQUIRE(sink.size() == 4);
    REQUIRE(sink.find("demo::PersonLenses") != nullptr);
    REQUIRE(sink.find("demo::ShapePrisms") != nullptr);
    REQUIRE(sink.find("demo::ColorPrisms") != nullptr);
    REQUIRE(sink.find("demo::CompanyFocus") != nullptr);
}

TEST_CASE("an invalid request is reported and the pass continues", "[engine][error]") {
    auto types = demo_registry();
    MemoryCodeSink sink;
    Engine engine{types, sink};

    auto report = engine.run({optics("demo::Opaque"), optics("demo::Unknown"), optics("demo::Street"),
                              optics("demo::Account")});

    REQUIRE_FALSE(report.ok());
    REQUIRE(report.diagnostics.size() == 3);
    REQUIRE(report.diagnostics[0].type_name == "demo::Opaque");
    REQUIRE(report.diagnostics[1].type_name == "demo::Unknown");
    REQUIRE_THAT(report.diagnostics[2].message, ContainsSubstring("allowMutable"));

    REQUIRE(report.generated.size() == 1);
    REQUIRE(report.generated[0] == "demo::StreetLenses");
}

TEST_CASE("request errors are logged only when verbose logging is on", "[engine][log]") {
    auto types = demo_registry();
    MemoryCodeSink sink;
    Engine engine{types, sink};

    std::ostringstream captured;
    auto* previous = std::cerr.rdbuf(captured.rdbuf());
    auto report = engine.run({optics("demo::Opaque")});
    std::cerr.rdbuf(previous);

    REQUIRE(report.diagnostics.size() == 1);
#if OPTICSGEN_VERBOSE_LOG
    REQUIRE_THAT(captured.str(), ContainsSubstring("[Engine] Warning: "));
    REQUIRE_THAT(captured.str(), ContainsSubstring(report.diagnostics[0].message));
#else
    REQUIRE(captured.str().empty());
#endif
}

TEST_CASE("a class name is produced at most once per pass", "[engine][once]") {
    auto types = demo_registry();
    MemoryCodeSink sink;
    Engine engine{types, sink};

    auto report = engine.run({optics("demo::Street"), optics("demo::Street")});

    REQUIRE(report.generated.size() == 1);
    REQUIRE(report.diagnostics.size() == 1);
    REQUIRE_THAT(report.diagnostics[0].message, ContainsSubstring("already produced"));
    REQUIRE(sink.size() == 1);
}

TEST_CASE("spec requests produce the spec class", "[engine][spec]") {
    auto types = demo_registry();
    types.add(spec_interface("demo::StreetOpticsSpec", demo("Street"), {
        optic_method("number", "Lens", demo("Street"), int_type(),
                     {annotation("ViaConstructor", {{"parameterOrder", std::vector<std::string>{"name", "number"}}})}),
    }));
    MemoryCodeSink sink;
    Engine engine{types, sink};

    auto report = engine.run({GenerationRequest{"demo::StreetOpticsSpec", RequestKind::Spec, {}}});

    REQUIRE(report.ok());
    const auto* generated = sink.find("demo::StreetOptics");
    REQUIRE(generated != nullptr);
    REQUIRE(generated->find_as<OpticMember>("number")->body
            == expr::lens(expr::call(expr::source(), "number"),
                          expr::construct(demo("Street"), {expr::call(expr::source(), "name"), expr::new_value()})));
}

TEST_CASE("plan does not write", "[engine][plan]") {
    auto types = demo_registry();
    MemoryCodeSink sink;
    Engine engine{types, sink};

    auto generated = engine.plan(optics("demo::Money"));
    REQUIRE(generated.name == "MoneyLenses");
    REQUIRE(sink.size() == 0);
    REQUIRE_THROWS_AS(engine.plan(optics("demo::Missing")), GenerationError);
}

TEST_CASE("text sink renders what the engine writes", "[engine][text]") {
    auto types = demo_registry();
    TextCodeSink sink;
    Engine engine{types, sink};

    auto report = engine.run({optics("demo::Street")});
    REQUIRE(report.ok());

    const auto* text = sink.find("demo::StreetLenses");
    REQUIRE(text != nullptr);
    REQUIRE_THAT(*text, ContainsSubstring("struct StreetLenses"));
    REQUIRE_THAT(*text, ContainsSubstring("namespace demo {"));
}
