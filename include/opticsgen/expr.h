// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file expr.h
/// @brief Structured snippets: the expression trees generated members carry.
///
/// Generated code is never assembled as text inside the engine. Each member
/// body is an immutable tree built from a small set of primitives, so that
/// tests compare structure and a backend (see code_printer.h) renders it.
///
/// Value-level nodes are evaluated against two implicit variables:
///   - SourceRef:   the whole value the optic is applied to
///   - NewValueRef: the replacement focus value (setters and reviews)
///
/// Optic-level nodes (LensOf, PrismOf, TraversalRef, OpticRef, Compose)
/// denote optics rather than values.
///
/// Recursive children are held in immer::box, so trees share structure and
/// are cheap to copy.

#pragma once

#include <opticsgen/opticsgen_config.h>
#include <opticsgen/api.h>
#include <opticsgen/type_model.h>

#include <immer/box.hpp>
#include <immer/vector.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace opticsgen {

struct Expr;
using ExprBox = immer::box<Expr>;
using ExprList = immer::vector<ExprBox>;

// ============================================================
// Value-level nodes
// ============================================================

struct SourceRef {
    friend bool operator==(const SourceRef&, const SourceRef&) = default;
};

struct NewValueRef {
    friend bool operator==(const NewValueRef&, const NewValueRef&) = default;
};

/// receiver.method(args...)
struct MethodCall {
    ExprBox receiver;
    std::string method;
    ExprList args;

    friend bool operator==(const MethodCall&, const MethodCall&) = default;
};

/// Positional constructor call.
struct ConstructorCall {
    TypeRef type;
    ExprList args;

    friend bool operator==(const ConstructorCall&, const ConstructorCall&) = default;
};

/// copy = type(original); copy.setter(value); yields copy
struct CopyThenSet {
    TypeRef copy_type;
    ExprBox original;
    std::string setter;
    ExprBox value;

    friend bool operator==(const CopyThenSet&, const CopyThenSet&) = default;
};

/// Runtime subtype test; yields a boolean.
struct InstanceOfTest {
    ExprBox subject;
    TypeRef type;

    friend bool operator==(const InstanceOfTest&, const InstanceOfTest&) = default;
};

/// Checked narrowing to a subtype.
struct Narrow {
    ExprBox subject;
    TypeRef type;

    friend bool operator==(const Narrow&, const Narrow&) = default;
};

struct ConstantRef {
    TypeRef type;
    std::string constant;

    friend bool operator==(const ConstantRef&, const ConstantRef&) = default;
};

/// subject == type::constant; yields a boolean.
struct ConstantEquals {
    ExprBox subject;
    TypeRef type;
    std::string constant;

    friend bool operator==(const ConstantEquals&, const ConstantEquals&) = default;
};

/// optic.set(value, target)
struct OpticSet {
    ExprBox optic;
    ExprBox target;
    ExprBox value;

    friend bool operator==(const OpticSet&, const OpticSet&) = default;
};

/// Raises when evaluated by the generated code, never during generation.
struct Unsupported {
    std::string message;

    friend bool operator==(const Unsupported&, const Unsupported&) = default;
};

// ============================================================
// Optic-level nodes
// ============================================================

struct LensOf {
    ExprBox getter;
    ExprBox setter;

    friend bool operator==(const LensOf&, const LensOf&) = default;
};

struct PrismOf {
    ExprBox matches;
    ExprBox extract;
    ExprBox review;

    friend bool operator==(const PrismOf&, const PrismOf&) = default;
};

/// Reference to an existing traversal. A call reference is rendered with
/// one pair of parentheses, a constant reference with none.
struct TraversalRef {
    std::string target;
    bool call = false;

    friend bool operator==(const TraversalRef&, const TraversalRef&) = default;
};

/// Member of a generated class, e.g. the field lens a traversal builds on.
struct OpticRef {
    std::string owner;
    std::string member;

    friend bool operator==(const OpticRef&, const OpticRef&) = default;
};

/// outer then inner: the focus of outer is the source of inner.
struct Compose {
    ExprBox outer;
    ExprBox inner;

    friend bool operator==(const Compose&, const Compose&) = default;
};

// ============================================================
// Expr
// ============================================================

struct OPTICSGEN_API Expr {
    using Node = std::variant<SourceRef, NewValueRef, MethodCall, ConstructorCall, CopyThenSet,
                              InstanceOfTest, Narrow, ConstantRef, ConstantEquals, OpticSet,
                              Unsupported, LensOf, PrismOf, TraversalRef, OpticRef, Compose>;

    Node node;

    template<typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(node); }

    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&node); }

    template<typename T>
    [[nodiscard]] const T& as() const { return std::get<T>(node); }

    /// True for LensOf, PrismOf, TraversalRef, OpticRef and Compose.
    [[nodiscard]] bool is_optic() const noexcept;

    friend bool operator==(const Expr&, const Expr&) = default;
};

// ============================================================
// Builders
// ============================================================

namespace expr {

[[nodiscard]] OPTICSGEN_API Expr source();
[[nodiscard]] OPTICSGEN_API Expr new_value();
[[nodiscard]] OPTICSGEN_API Expr call(Expr receiver, std::string method, std::vector<Expr> args = {});
[[nodiscard]] OPTICSGEN_API Expr construct(TypeRef type, std::vector<Expr> args);
[[nodiscard]] OPTICSGEN_API Expr copy_then_set(TypeRef copy_type, Expr original, std::string setter, Expr value);
[[nodiscard]] OPTICSGEN_API Expr instance_of(Expr subject, TypeRef type);
[[nodiscard]] OPTICSGEN_API Expr narrow(Expr subject, TypeRef type);
[[nodiscard]] OPTICSGEN_API Expr constant(TypeRef type, std::string constant);
[[nodiscard]] OPTICSGEN_API Expr constant_equals(Expr subject, TypeRef type, std::string constant);
[[nodiscard]] OPTICSGEN_API Expr optic_set(Expr optic, Expr target, Expr value);
[[nodiscard]] OPTICSGEN_API Expr unsupported(std::string message);
[[nodiscard]] OPTICSGEN_API Expr lens(Expr getter, Expr setter);
[[nodiscard]] OPTICSGEN_API Expr prism(Expr matches, Expr extract, Expr review);
/// "X::each()" becomes a call reference to "X::each", "X::EACH" a constant reference.
[[nodiscard]] OPTICSGEN_API Expr traversal_ref(std::string_view reference);
[[nodiscard]] OPTICSGEN_API Expr optic_ref(std::string owner, std::string member);
[[nodiscard]] OPTICSGEN_API Expr compose(Expr outer, Expr inner);

} // namespace expr

} // namespace opticsgen
