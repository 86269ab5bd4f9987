// test_code_printer.cpp - Tests for the C++ text backend

#include <catch2/catch_all.hpp>
#include <opticsgen/code_printer.h>
#include <opticsgen/diagnostics.h>
#include <opticsgen/navigator.h>
#include <opticsgen/optics_generator.h>

#include "test_fixtures.h"

using namespace opticsgen;
using namespace fixtures;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("print_expr renders value expressions", "[printer][expr]") {
    REQUIRE(print_expr(expr::call(expr::source(), "withName", {expr::new_value()})) == "source.withName(newValue)");
    REQUIRE(print_expr(expr::construct(demo("Street"), {expr::call(expr::source(), "name"), expr::new_value()}))
            == "demo::Street{source.name(), newValue}");
    REQUIRE(print_expr(expr::constant_equals(expr::source(), demo("Color"), "RED")) == "(source == demo::Color::RED)");
    REQUIRE(print_expr(expr::unsupported("say \"no\"")) == "opticsgen::unsupported(\"say \\\"no\\\"\")");
}

TEST_CASE("print_expr renders optic expressions", "[printer][optic]") {
    REQUIRE(print_expr(expr::traversal_ref("demo::Traversals::each()")) == "demo::Traversals::each()");
    REQUIRE(print_expr(expr::traversal_ref("demo::Traversals::EACH")) == "demo::Traversals::EACH");
    REQUIRE(print_expr(expr::compose(expr::optic_ref("demo::PersonLenses", "tags"),
                                     expr::traversal_ref("opticsgen::traversals::for_list()")))
            == "zug::comp(demo::PersonLenses::tags(), opticsgen::traversals::for_list())");

    auto lens = print_expr(expr::lens(expr::call(expr::source(), "amount"),
                                      expr::call(expr::source(), "withAmount", {expr::new_value()})));
    REQUIRE_THAT(lens, ContainsSubstring("lager::lenses::getset("));
    REQUIRE_THAT(lens, ContainsSubstring("return source.withAmount(newValue);"));
}

TEST_CASE("print_class renders lens classes", "[printer][class]") {
    auto types = demo_registry();
    TypeShapeAnalyser analyser{types};
    OpticsGenerator generator{types};
    auto text = print_class(generator.generate(analyser.analyse(*types.find("demo::Street")), GeneratorOptions{}));

    REQUIRE_THAT(text, ContainsSubstring("namespace demo {"));
    REQUIRE_THAT(text, ContainsSubstring("struct StreetLenses"));
    REQUIRE_THAT(text, ContainsSubstring("/// Lens<demo::Street, int>"));
    REQUIRE_THAT(text, ContainsSubstring("static auto number()"));
    REQUIRE_THAT(text, ContainsSubstring("static demo::Street withName(demo::Street source, std::string newValue)"));
    REQUIRE_THAT(text, ContainsSubstring("} // namespace demo"));
}

TEST_CASE("print_class renders navigators as templates over the root", "[printer][navigator]") {
    auto types = demo_registry();
    TypeShapeAnalyser analyser{types};
    NavigatorComposer composer{types, analyser};
    auto text = print_class(composer.compose(analyser.analyse(*types.find("demo::Person")), GeneratorOptions{}));

    REQUIRE_THAT(text, ContainsSubstring("template <typename S>"));
    REQUIRE_THAT(text, ContainsSubstring("struct AddressNavigator"));
    REQUIRE_THAT(text, ContainsSubstring("opticsgen::FocusPath<S, demo::Address> delegate;"));
    REQUIRE_THAT(text, ContainsSubstring("static AddressNavigator<demo::Person> address()"));
    REQUIRE_THAT(text, ContainsSubstring("opticsgen::TraversalPath<demo::Person, std::string>"));
}

TEST_CASE("nested navigators for a repeated field get distinct names", "[printer][navigator]") {
    auto types = demo_registry();
    TypeShapeAnalyser analyser{types};
    NavigatorComposer composer{types, analyser};
    GeneratorOptions options;
    options.max_navigator_depth = 2;
    auto text = print_class(composer.compose(analyser.analyse(*types.find("demo::Node")), options));

    REQUIRE_THAT(text, ContainsSubstring("struct NextNavigator\n"));
    REQUIRE_THAT(text, ContainsSubstring("struct NextNavigator2\n"));
    REQUIRE_THAT(text, ContainsSubstring("static NextNavigator2<S> next()"));
    REQUIRE_THAT(text, ContainsSubstring("static NextNavigator<demo::Node> next()"));
}

TEST_CASE("printing is deterministic", "[printer]") {
    auto types = demo_registry();
    TypeShapeAnalyser analyser{types};
    OpticsGenerator generator{types};
    auto shape = analyser.analyse(*types.find("demo::Person"));
    REQUIRE(print_class(generator.generate(shape, GeneratorOptions{}))
            == print_class(generator.generate(shape, GeneratorOptions{})));
}

TEST_CASE("TextCodeSink rejects a second write of the same class", "[printer][sink]") {
    auto types = demo_registry();
    TypeShapeAnalyser analyser{types};
    OpticsGenerator generator{types};
    auto generated = generator.generate(analyser.analyse(*types.find("demo::Street")), GeneratorOptions{});

    TextCodeSink sink;
    sink.write(generated);
    REQUIRE_THROWS_AS(sink.write(generated), GenerationError);
    REQUIRE(sink.sources().size() == 1);
}
