// test_options.cpp - Tests for GeneratorOptions parsing and field filters

#include <catch2/catch_all.hpp>
#include <opticsgen/diagnostics.h>
#include <opticsgen/options.h>

using namespace opticsgen;

TEST_CASE("defaults", "[options]") {
    GeneratorOptions options;
    REQUIRE(options.max_navigator_depth == kDefaultNavigatorDepth);
    REQUIRE(options.effective_depth() == 1);
    REQUIRE(options.generate_navigators);
    REQUIRE_FALSE(options.allow_mutable_fields);
    REQUIRE(options.field_selected("anything"));
    REQUIRE(options.scope_for("demo") == "demo");
}

TEST_CASE("parse_options reads every key", "[options][parse]") {
    auto options = parse_options({
        "opticsgen.maxNavigatorDepth=3",
        "opticsgen.includeFields=name, address ,tags",
        "opticsgen.excludeFields=tags",
        "opticsgen.allowMutable=true",
        "opticsgen.targetPackage=gen::optics",
        "opticsgen.generateNavigators=false",
    });

    REQUIRE(options.max_navigator_depth == 3);
    REQUIRE(options.include_fields.size() == 3);
    REQUIRE(options.include_fields.count("address") == 1);
    REQUIRE(options.exclude_fields.count("tags") == 1);
    REQUIRE(options.allow_mutable_fields);
    REQUIRE(options.scope_for("demo") == "gen::optics");
    REQUIRE_FALSE(options.generate_navigators);
}

TEST_CASE("exclusion wins over inclusion", "[options][filter]") {
    auto options = parse_options({"opticsgen.includeFields=name,tags", "opticsgen.excludeFields=tags"});
    REQUIRE(options.field_selected("name"));
    REQUIRE_FALSE(options.field_selected("tags"));
    REQUIRE_FALSE(options.field_selected("age"));
}

TEST_CASE("depth is clamped to the maximum", "[options][depth]") {
    auto options = parse_options({"opticsgen.maxNavigatorDepth=50"});
    REQUIRE(options.max_navigator_depth == kMaxNavigatorDepth);

    GeneratorOptions manual;
    manual.max_navigator_depth = 0;
    REQUIRE(manual.effective_depth() == 1);
    manual.max_navigator_depth = 99;
    REQUIRE(manual.effective_depth() == kMaxNavigatorDepth);
}

TEST_CASE("invalid options raise ConfigError", "[options][error]") {
    auto parse_one = [](std::string arg) { return parse_options({std::move(arg)}); };

    REQUIRE_THROWS_AS(parse_one("opticsgen.maxNavigatorDepth=0"), ConfigError);
    REQUIRE_THROWS_AS(parse_one("opticsgen.maxNavigatorDepth=-2"), ConfigError);
    REQUIRE_THROWS_AS(parse_one("opticsgen.maxNavigatorDepth=two"), ConfigError);
    REQUIRE_THROWS_AS(parse_one("opticsgen.allowMutable=yes"), ConfigError);
    REQUIRE_THROWS_AS(parse_one("opticsgen.colour=blue"), ConfigError);
    REQUIRE_THROWS_AS(parse_one("maxNavigatorDepth=2"), ConfigError);
    REQUIRE_THROWS_WITH(parse_one("opticsgen.allowMutable"),
                        Catch::Matchers::ContainsSubstring("expected opticsgen.<key>=<value>"));
}
