// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_model.h
/// @brief Introspection model: the declared types the engine analyses.
///
/// This is the engine's view of a host reflection result. It is produced by
/// an external provider (a compiler plugin, a schema reader, or a test
/// fixture) and handed to the analysers through TypeIntrospector.
///
/// Qualified names use "::" as scope separator.

#pragma once

#include <opticsgen/opticsgen_config.h>
#include <opticsgen/api.h>
#include <opticsgen/concepts.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace opticsgen {

// ============================================================
// TypeRef - a type usage
// ============================================================

enum class TypeRefKind : std::uint8_t {
    Declared,     ///< named type, possibly parameterised
    Array,        ///< built-in array; component is the single argument
    Primitive,    ///< int, bool, double, ...
    Void,         ///< no value (setter return type)
    TypeVariable, ///< type parameter of the enclosing declaration
};

struct OPTICSGEN_API TypeRef {
    TypeRefKind kind = TypeRefKind::Void;
    std::string name;
    std::vector<TypeRef> args;

    [[nodiscard]] static TypeRef declared(StringLike auto&& name, std::vector<TypeRef> args = {})
    {
        return TypeRef{TypeRefKind::Declared, std::string{std::forward<decltype(name)>(name)}, std::move(args)};
    }

    [[nodiscard]] static TypeRef primitive(StringLike auto&& name)
    {
        return TypeRef{TypeRefKind::Primitive, std::string{std::forward<decltype(name)>(name)}, {}};
    }

    [[nodiscard]] static TypeRef variable(StringLike auto&& name)
    {
        return TypeRef{TypeRefKind::TypeVariable, std::string{std::forward<decltype(name)>(name)}, {}};
    }

    [[nodiscard]] static TypeRef array_of(TypeRef component);
    [[nodiscard]] static TypeRef void_type() { return TypeRef{}; }

    [[nodiscard]] bool is_void() const noexcept { return kind == TypeRefKind::Void; }
    [[nodiscard]] bool is_array() const noexcept { return kind == TypeRefKind::Array; }
    [[nodiscard]] bool is_declared() const noexcept { return kind == TypeRefKind::Declared; }

    /// Same type with all type arguments removed (arrays erase their component).
    [[nodiscard]] TypeRef erasure() const;

    [[nodiscard]] std::string simple_name() const;

    /// Rendered as in source: "std::vector<std::string>", "int[]".
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const TypeRef&, const TypeRef&) = default;
};

// ============================================================
// Annotations
// ============================================================

using AnnotationValue = std::variant<std::string, std::vector<std::string>, TypeRef>;

struct OPTICSGEN_API AnnotationDecl {
    std::string name;
    std::map<std::string, AnnotationValue, std::less<>> values;

    /// Empty string when the attribute is absent or not a string.
    [[nodiscard]] std::string string_value(std::string_view key) const;
    [[nodiscard]] std::vector<std::string> list_value(std::string_view key) const;
    [[nodiscard]] std::optional<TypeRef> type_value(std::string_view key) const;
};

// ============================================================
// Members
// ============================================================

struct Modifiers {
    bool is_public = true;
    bool is_static = false;
    bool is_abstract = false;
    bool is_default = false; ///< interface method with a body
};

struct ParamDecl {
    std::string name;
    TypeRef type;
};

struct OPTICSGEN_API MethodDecl {
    std::string name;
    Modifiers modifiers;
    std::vector<ParamDecl> params;
    TypeRef return_type;
    std::vector<AnnotationDecl> annotations;

    [[nodiscard]] const AnnotationDecl* find_annotation(std::string_view annotation) const noexcept;
};

/// Record component or public field.
struct ComponentDecl {
    std::string name;
    TypeRef type;
};

// ============================================================
// TypeDecl - one declared type
// ============================================================

enum class DeclKind : std::uint8_t {
    Record,    ///< public immutable components in fixed order
    Class,
    Interface,
    Enum,
    Other,
};

struct OPTICSGEN_API TypeDecl {
    std::string qualified_name;
    DeclKind kind = DeclKind::Class;
    bool sealed = false;
    std::vector<std::string> type_parameters;
    std::vector<ComponentDecl> components;
    std::vector<ComponentDecl> public_fields;
    std::vector<TypeRef> permitted_subtypes;
    std::vector<std::string> enum_constants;
    std::vector<MethodDecl> methods;
    std::vector<TypeRef> supertypes;

    [[nodiscard]] std::string simple_name() const;
    [[nodiscard]] std::string scope() const;

    /// The declared type applied to its own type parameters.
    [[nodiscard]] TypeRef self_type() const;

    [[nodiscard]] const MethodDecl* find_method(std::string_view name, std::size_t arity) const noexcept;
    [[nodiscard]] const ComponentDecl* find_component(std::string_view name) const noexcept;
};

// ============================================================
// TypeIntrospector - the provider seam
// ============================================================

/// Answers the structural questions the analysers ask about declared types.
class OPTICSGEN_API TypeIntrospector {
public:
    virtual ~TypeIntrospector() = default;

    /// nullptr when the type is not known to the provider.
    [[nodiscard]] virtual const TypeDecl* find(std::string_view qualified_name) const = 0;

    /// Erasure-based, reflexive and transitive.
    [[nodiscard]] virtual bool is_subtype(const TypeRef& sub, const TypeRef& super) const = 0;

    [[nodiscard]] virtual bool is_same_type(const TypeRef& a, const TypeRef& b) const { return a == b; }
};

} // namespace opticsgen
