// test_type_shape.cpp - Tests for TypeShapeAnalyser
// Shape order, field descriptors, wither pairing and setter detection

#include <catch2/catch_all.hpp>
#include <opticsgen/type_shape.h>

#include "test_fixtures.h"

using namespace opticsgen;
using namespace fixtures;

// ============================================================
// Shape classification
// ============================================================

TEST_CASE("every declaration gets exactly one shape", "[shape]") {
    auto types = demo_registry();
    TypeShapeAnalyser analyser{types};

    auto shape_of = [&](const std::string& name) { return analyser.analyse(*types.find(name)).kind(); };

    REQUIRE(shape_of("demo::Person") == ShapeKind::Product);
    REQUIRE(shape_of("demo::Shape") == ShapeKind::Sum);
    REQUIRE(shape_of("demo::Color") == ShapeKind::Enumerated);
    REQUIRE(shape_of("demo::Money") == ShapeKind::CopyMutable);
    REQUIRE(shape_of("demo::Opaque") == ShapeKind::Unsupported);
}

TEST_CASE("earlier shapes win over later ones", "[shape]") {
    TypeRegistry types;
    TypeShapeAnalyser analyser{types};

    SECTION("record with a wither is a product") {
        auto decl = record("demo::Point", {{"x", int_type()}});
        decl.methods = {getter("x", int_type()), wither("withX", demo("Point"), int_type())};
        types.add(decl);
        REQUIRE(analyser.analyse(decl).kind() == ShapeKind::Product);
    }

    SECTION("enum with a wither is enumerated") {
        auto decl = color_decl();
        decl.methods = {getter("rgb", int_type()), wither("withRgb", demo("Color"), int_type())};
        types.add(decl);
        REQUIRE(analyser.analyse(decl).kind() == ShapeKind::Enumerated);
    }

    SECTION("unsealed interface is not a sum") {
        auto decl = shape_decl();
        decl.sealed = false;
        types.add(decl);
        REQUIRE(analyser.analyse(decl).kind() == ShapeKind::Unsupported);
    }
}

TEST_CASE("product fields keep declaration order and containers", "[shape][product]") {
    auto types = demo_registry();
    TypeShapeAnalyser analyser{types};
    auto shape = analyser.analyse(*types.find("demo::Person"));

    auto fields = shape.fields();
    REQUIRE(fields.size() == 5);
    REQUIRE(fields[0].name == "name");
    REQUIRE(fields[4].name == "address");
    REQUIRE(fields[0].accessor == "name");

    REQUIRE_FALSE(fields[0].has_traversal());
    REQUIRE(fields[2].has_traversal());
    REQUIRE(fields[2].container->kind == ContainerKind::List);
    REQUIRE(fields[3].container->kind == ContainerKind::Optional);

    REQUIRE(shape.supports_lens());
    REQUIRE_FALSE(shape.supports_prism());
    REQUIRE(shape.scope() == "demo");
    REQUIRE(shape.simple_name() == "Person");
}

TEST_CASE("sum and enumerated shapes list their alternatives", "[shape]") {
    auto types = demo_registry();
    TypeShapeAnalyser analyser{types};

    auto sum = analyser.analyse(*types.find("demo::Shape"));
    REQUIRE(sum.variants().size() == 2);
    REQUIRE(sum.variants()[0] == demo("Circle"));
    REQUIRE(sum.supports_prism());

    auto colors = analyser.analyse(*types.find("demo::Color"));
    REQUIRE(colors.constants().size() == 3);
    REQUIRE(colors.constants()[1] == "DARK_BLUE");
}

// ============================================================
// Wither pairing
// ============================================================

TEST_CASE("withers pair with field, getField or isField getters", "[shape][wither]") {
    auto types = demo_registry();
    TypeShapeAnalyser analyser{types};

    auto ops = analyser.detect_copy_operations(*types.find("demo::Money"));
    REQUIRE(ops.size() == 2);
    REQUIRE(ops[0] == CopyOperation{"amount", "withAmount", "amount", double_type()});
    REQUIRE(ops[1] == CopyOperation{"getCurrency", "withCurrency", "currency", string_type()});

    SECTION("isField getter") {
        TypeRegistry local;
        auto flag = plain_class("demo::Flag", {
            getter("isEnabled", TypeRef::primitive("bool")),
            wither("withEnabled", demo("Flag"), TypeRef::primitive("bool")),
        });
        local.add(flag);
        TypeShapeAnalyser flags{local};
        auto found = flags.detect_copy_operations(flag);
        REQUIRE(found.size() == 1);
        REQUIRE(found[0].getter_name == "isEnabled");
        REQUIRE(found[0].field_name == "enabled");
    }
}

TEST_CASE("wither candidates failing a rule are skipped", "[shape][wither]") {
    TypeRegistry types;
    auto self = demo("Box");

    auto analyse_methods = [&](std::vector<MethodDecl> methods) {
        auto decl = plain_class("demo::Box", std::move(methods));
        types.add(decl);
        TypeShapeAnalyser analyser{types};
        return analyser.detect_copy_operations(decl);
    };

    SECTION("bare 'with' is not a wither") {
        REQUIRE(analyse_methods({getter("x", int_type()), wither("with", self, int_type())}).empty());
    }

    SECTION("static wither") {
        auto w = wither("withX", self, int_type());
        w.modifiers.is_static = true;
        REQUIRE(analyse_methods({getter("x", int_type()), w}).empty());
    }

    SECTION("non-public wither") {
        auto w = wither("withX", self, int_type());
        w.modifiers.is_public = false;
        REQUIRE(analyse_methods({getter("x", int_type()), w}).empty());
    }

    SECTION("two parameters") {
        auto w = method("withX", self, {ParamDecl{"a", int_type()}, ParamDecl{"b", int_type()}});
        REQUIRE(analyse_methods({getter("x", int_type()), w}).empty());
    }

    SECTION("returns an unrelated type") {
        REQUIRE(analyse_methods({getter("x", int_type()), wither("withX", string_type(), int_type())}).empty());
    }

    SECTION("getter type differs from the wither parameter") {
        REQUIRE(analyse_methods({getter("x", string_type()), wither("withX", self, int_type())}).empty());
    }

    SECTION("static getter") {
        auto g = getter("x", int_type());
        g.modifiers.is_static = true;
        REQUIRE(analyse_methods({g, wither("withX", self, int_type())}).empty());
    }

    SECTION("no getter") {
        REQUIRE(analyse_methods({wither("withX", self, int_type())}).empty());
    }
}

TEST_CASE("overloaded withers keep the first pairing per field", "[shape][wither]") {
    TypeRegistry types;
    auto decl = plain_class("demo::Box", {
        getter("x", int_type()),
        wither("withX", demo("Box"), int_type()),
        wither("withX", demo("Box"), int_type()),
    });
    types.add(decl);
    TypeShapeAnalyser analyser{types};
    REQUIRE(analyser.detect_copy_operations(decl).size() == 1);
}

TEST_CASE("a wither returning a subtype of the declaring type pairs", "[shape][wither]") {
    TypeRegistry types;
    auto base = plain_class("demo::Base", {
        getter("x", int_type()),
        wither("withX", demo("Derived"), int_type()),
    });
    auto derived = plain_class("demo::Derived");
    derived.supertypes = {demo("Base")};
    types.add(base).add(derived);

    TypeShapeAnalyser analyser{types};
    REQUIRE(analyser.detect_copy_operations(base).size() == 1);
}

// ============================================================
// Mutable setters
// ============================================================

TEST_CASE("public void single-argument setters mark a type mutable", "[shape][mutable]") {
    auto types = demo_registry();
    TypeShapeAnalyser analyser{types};

    REQUIRE(analyser.detect_mutable_fields(*types.find("demo::Account")));
    REQUIRE_FALSE(analyser.detect_mutable_fields(*types.find("demo::Money")));

    auto shape = analyser.analyse(*types.find("demo::Account"));
    REQUIRE(shape.kind() == ShapeKind::CopyMutable);
    REQUIRE(shape.has_mutable_fields());

    SECTION("a fluent setter returning the type is not a mutable setter") {
        auto fluent = plain_class("demo::Fluent", {method("setX", demo("Fluent"), {ParamDecl{"x", int_type()}})});
        REQUIRE_FALSE(analyser.detect_mutable_fields(fluent));
    }

    SECTION("a bare 'set' is not a setter") {
        auto bare = plain_class("demo::Bare", {setter("set", int_type())});
        REQUIRE_FALSE(analyser.detect_mutable_fields(bare));
    }

    SECTION("one character past 'set' is a setter") {
        auto shortest = plain_class("demo::Shortest", {setter("setX", int_type())});
        REQUIRE(analyser.detect_mutable_fields(shortest));
    }
}

TEST_CASE("visit dispatches on the shape alternative", "[shape]") {
    auto types = demo_registry();
    TypeShapeAnalyser analyser{types};
    auto shape = analyser.analyse(*types.find("demo::Color"));

    auto label = shape.visit([](const auto& s) -> std::string {
        using S = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<S, EnumeratedShape>) {
            return "enum:" + std::to_string(s.constants.size());
        } else {
            return "other";
        }
    });
    REQUIRE(label == "enum:3");
}
