// test_traversal_hint.cpp - Tests for traversal hint resolution

#include <catch2/catch_all.hpp>
#include <opticsgen/diagnostics.h>
#include <opticsgen/traversal_hint.h>

using namespace opticsgen;

TEST_CASE("TraverseWith keeps the reference as written", "[traversal][traverse-with]") {
    SECTION("call reference") {
        auto t = resolve_traversal(TraverseWithHint{"demo::Traversals::eachTag()"}, "demo::PersonOptics");
        REQUIRE(t == Expr{TraversalRef{"demo::Traversals::eachTag", true}});
    }

    SECTION("constant reference") {
        auto t = resolve_traversal(TraverseWithHint{"demo::Traversals::EACH_TAG"}, "demo::PersonOptics");
        REQUIRE(t == Expr{TraversalRef{"demo::Traversals::EACH_TAG", false}});
    }

    SECTION("empty reference") {
        REQUIRE_THROWS_AS(resolve_traversal(TraverseWithHint{}, "demo::PersonOptics"), GenerationError);
    }
}

TEST_CASE("ThroughField composes the owner's field lens with the traversal", "[traversal][through-field]") {
    auto t = resolve_traversal(ThroughFieldHint{"tags", "opticsgen::traversals::for_list()"}, "demo::PersonOptics");
    REQUIRE(t == expr::compose(expr::optic_ref("demo::PersonOptics", "tags"),
                               expr::traversal_ref("opticsgen::traversals::for_list()")));

    SECTION("undetected traversal is a defect") {
        REQUIRE_THROWS_AS(resolve_traversal(ThroughFieldHint{"tags", ""}, "demo::PersonOptics"),
                          UnresolvedStrategyError);
    }
}

TEST_CASE("no traversal hint is a defect", "[traversal][error]") {
    REQUIRE_THROWS_AS(resolve_traversal(NoTraversalHint{}, "demo::PersonOptics"), UnresolvedStrategyError);
    REQUIRE_THROWS_WITH(resolve_traversal(NoTraversalHint{}, "demo::PersonOptics"),
                        Catch::Matchers::ContainsSubstring("No traversal hint for demo::PersonOptics"));
}
