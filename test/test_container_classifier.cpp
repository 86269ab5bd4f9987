// test_container_classifier.cpp - Tests for container recognition
// Standard families, arity checks, arrays and container subtypes

#include <catch2/catch_all.hpp>
#include <opticsgen/container_classifier.h>

#include "test_fixtures.h"

#include <set>

using namespace opticsgen;
using namespace fixtures;

// ============================================================
// Standard families
// ============================================================

TEST_CASE("classify recognises the standard families", "[container]") {
    ContainerClassifier classifier;

    SECTION("list") {
        auto c = classifier.classify(vector_of(string_type()));
        REQUIRE(c.has_value());
        REQUIRE(c->kind == ContainerKind::List);
        REQUIRE(c->element == string_type());
        REQUIRE_FALSE(c->key.has_value());
    }

    SECTION("immer vector is a list") {
        auto c = classifier.classify(TypeRef::declared("immer::vector", {int_type()}));
        REQUIRE(c.has_value());
        REQUIRE(c->kind == ContainerKind::List);
    }

    SECTION("set") {
        auto c = classifier.classify(TypeRef::declared("std::set", {int_type()}));
        REQUIRE(c.has_value());
        REQUIRE(c->kind == ContainerKind::Set);
        REQUIRE(c->element == int_type());
    }

    SECTION("map focuses on values") {
        auto c = classifier.classify(map_of(string_type(), demo("Address")));
        REQUIRE(c.has_value());
        REQUIRE(c->is_map());
        REQUIRE(c->element == demo("Address"));
        REQUIRE(c->key == string_type());
    }

    SECTION("optional") {
        auto c = classifier.classify(optional_of(string_type()));
        REQUIRE(c.has_value());
        REQUIRE(c->kind == ContainerKind::Optional);
    }

    SECTION("array") {
        auto c = classifier.classify(TypeRef::array_of(int_type()));
        REQUIRE(c.has_value());
        REQUIRE(c->kind == ContainerKind::Array);
        REQUIRE(c->element == int_type());
    }
}

TEST_CASE("classify refuses raw and unknown usages", "[container]") {
    ContainerClassifier classifier;

    REQUIRE_FALSE(classifier.classify(TypeRef::declared("std::vector")).has_value());
    REQUIRE_FALSE(classifier.classify(TypeRef::declared("std::map", {string_type()})).has_value());
    REQUIRE_FALSE(classifier.classify(TypeRef::declared("std::optional", {int_type(), int_type()})).has_value());
    REQUIRE_FALSE(classifier.classify(string_type()).has_value());
    REQUIRE_FALSE(classifier.classify(int_type()).has_value());
    REQUIRE_FALSE(classifier.classify(TypeRef::variable("T")).has_value());
}

TEST_CASE("add_family registers project containers", "[container]") {
    ContainerClassifier classifier;
    classifier.add_family("demo::SmallVec", ContainerKind::List);

    auto c = classifier.classify(TypeRef::declared("demo::SmallVec", {int_type()}));
    REQUIRE(c.has_value());
    REQUIRE(c->kind == ContainerKind::List);

    SECTION("Array is not a family") {
        classifier.add_family("demo::Buffer", ContainerKind::Array);
        REQUIRE_FALSE(classifier.classify(TypeRef::declared("demo::Buffer", {int_type()})).has_value());
    }
}

// ============================================================
// Subtypes of containers
// ============================================================

TEST_CASE("classify_with_subtypes follows supertypes and binds parameters", "[container][subtype]") {
    TypeRegistry types;
    TypeDecl tag_list = plain_class("demo::TagList");
    tag_list.type_parameters = {"T"};
    tag_list.supertypes = {TypeRef::declared("std::vector", {TypeRef::variable("T")})};
    types.add(tag_list);

    TypeDecl names = plain_class("demo::Names");
    names.supertypes = {TypeRef::declared("demo::TagList", {string_type()})};
    types.add(names);

    ContainerClassifier classifier;

    SECTION("direct parameterised subtype") {
        auto c = classifier.classify_with_subtypes(TypeRef::declared("demo::TagList", {int_type()}), types);
        REQUIRE(c.has_value());
        REQUIRE(c->kind == ContainerKind::List);
        REQUIRE(c->element == int_type());
    }

    SECTION("transitive subtype") {
        auto c = classifier.classify_with_subtypes(TypeRef::declared("demo::Names"), types);
        REQUIRE(c.has_value());
        REQUIRE(c->element == string_type());
    }

    SECTION("raw subtype usage is refused") {
        REQUIRE_FALSE(classifier.classify_with_subtypes(TypeRef::declared("demo::TagList"), types).has_value());
    }

    SECTION("parameters nested inside supertype arguments are bound") {
        TypeDecl groups = plain_class("demo::Groups");
        groups.type_parameters = {"K", "V"};
        groups.supertypes = {TypeRef::declared("std::map", {TypeRef::variable("K"),
                                                            vector_of(optional_of(TypeRef::variable("V")))})};
        types.add(groups);

        auto c = classifier.classify_with_subtypes(TypeRef::declared("demo::Groups", {string_type(), int_type()}),
                                                   types);
        REQUIRE(c.has_value());
        REQUIRE(c->kind == ContainerKind::Map);
        REQUIRE(c->key == std::optional<TypeRef>{string_type()});
        REQUIRE(c->element == vector_of(optional_of(int_type())));
    }

    SECTION("plain classify does not look at supertypes") {
        REQUIRE_FALSE(classifier.classify(TypeRef::declared("demo::Names")).has_value());
    }
}

TEST_CASE("classify_with_subtypes terminates on cyclic hierarchies", "[container][subtype]") {
    TypeRegistry types;
    TypeDecl a = plain_class("demo::A");
    a.supertypes = {TypeRef::declared("demo::B")};
    TypeDecl b = plain_class("demo::B");
    b.supertypes = {TypeRef::declared("demo::A")};
    types.add(a).add(b);

    ContainerClassifier classifier;
    REQUIRE_FALSE(classifier.classify_with_subtypes(TypeRef::declared("demo::A"), types).has_value());
}

TEST_CASE("standard traversal references are distinct calls", "[container]") {
    std::set<std::string_view> references;
    for (auto kind : {ContainerKind::List, ContainerKind::Set, ContainerKind::Map, ContainerKind::Optional,
                      ContainerKind::Array}) {
        auto ref = standard_traversal(kind);
        REQUIRE(ref.ends_with("()"));
        references.insert(ref);
    }
    REQUIRE(references.size() == 5);
    REQUIRE(standard_traversal(ContainerKind::List) == "opticsgen::traversals::for_list()");
}
