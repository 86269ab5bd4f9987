// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_shape.h
/// @brief Structural classification of declared types.
///
/// Every analysed type receives exactly one shape, decided in fixed order:
///
///   Product -> Sum -> Enumerated -> CopyMutable -> Unsupported
///
/// - Product:     record-like, public immutable components in fixed order
/// - Sum:         sealed hierarchy with an exhaustive permitted-subtype list
/// - Enumerated:  fixed set of named constants
/// - CopyMutable: ordinary class exposing wither/getter pairs
/// - Unsupported: none of the above
///
/// A type matching several shallow patterns (a record that also declares
/// withers, an enum with withers) takes the earliest shape in the order.

#pragma once

#include <opticsgen/container_classifier.h>
#include <opticsgen/concepts.h>
#include <opticsgen/type_model.h>

#include <immer/vector.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace opticsgen {

// ============================================================
// Shape building blocks
// ============================================================

enum class ShapeKind : std::uint8_t {
    Product,
    Sum,
    Enumerated,
    CopyMutable,
    Unsupported,
};

[[nodiscard]] OPTICSGEN_API std::string_view to_string(ShapeKind kind) noexcept;

struct OPTICSGEN_API FieldDescriptor {
    std::string name;
    TypeRef declared_type;
    std::optional<ContainerType> container;
    /// Zero-argument method reading the field ("name" for records, the paired getter otherwise).
    std::string accessor;

    [[nodiscard]] bool has_traversal() const noexcept { return container.has_value(); }

    friend bool operator==(const FieldDescriptor&, const FieldDescriptor&) = default;
};

/// A wither paired with its getter; both agree on the field type.
struct CopyOperation {
    std::string getter_name;
    std::string wither_name;
    std::string field_name;
    TypeRef field_type;

    friend bool operator==(const CopyOperation&, const CopyOperation&) = default;
};

struct ProductShape {
    immer::vector<FieldDescriptor> fields;
};

struct SumShape {
    immer::vector<TypeRef> variants;
};

struct EnumeratedShape {
    immer::vector<std::string> constants;
};

struct CopyMutableShape {
    immer::vector<FieldDescriptor> fields;
    immer::vector<CopyOperation> copy_operations;
    bool mutable_setters = false;
};

struct UnsupportedShape {
    bool mutable_setters = false;
};

// ============================================================
// TypeShape
// ============================================================

class OPTICSGEN_API TypeShape {
public:
    using Variant = std::variant<ProductShape, SumShape, EnumeratedShape, CopyMutableShape, UnsupportedShape>;

    TypeShape(TypeRef type, std::string scope, Variant shape);

    [[nodiscard]] ShapeKind kind() const noexcept { return static_cast<ShapeKind>(shape_.index()); }

    /// The analysed type applied to its own type parameters.
    [[nodiscard]] const TypeRef& type() const noexcept { return type_; }
    [[nodiscard]] const std::string& type_name() const noexcept { return type_.name; }
    [[nodiscard]] std::string simple_name() const { return type_.simple_name(); }
    /// Enclosing scope of the declaration; default target for generated classes.
    [[nodiscard]] const std::string& scope() const noexcept { return scope_; }

    /// Product and CopyMutable fields in declaration order; empty otherwise.
    [[nodiscard]] immer::vector<FieldDescriptor> fields() const;
    [[nodiscard]] immer::vector<TypeRef> variants() const;
    [[nodiscard]] immer::vector<std::string> constants() const;
    [[nodiscard]] immer::vector<CopyOperation> copy_operations() const;

    [[nodiscard]] bool supports_lens() const noexcept;
    [[nodiscard]] bool supports_prism() const noexcept;
    /// A public non-static single-argument void setter exists.
    [[nodiscard]] bool has_mutable_fields() const noexcept;

    [[nodiscard]] const Variant& shape() const noexcept { return shape_; }

    template<typename Visitor>
        requires ExhaustiveVisitor<Visitor, ProductShape, SumShape, EnumeratedShape,
                                   CopyMutableShape, UnsupportedShape>
    decltype(auto) visit(Visitor&& visitor) const
    {
        return std::visit(std::forward<Visitor>(visitor), shape_);
    }

private:
    TypeRef type_;
    std::string scope_;
    Variant shape_;
};

// ============================================================
// TypeShapeAnalyser
// ============================================================

/// Method-name prefixes recognised by the copy-operation and setter scans.
inline constexpr std::string_view kWitherPrefix = "with";
inline constexpr std::string_view kSetterPrefix = "set";

class OPTICSGEN_API TypeShapeAnalyser {
public:
    explicit TypeShapeAnalyser(const TypeIntrospector& types, ContainerClassifier classifier = {});

    /// Never fails: a type that fits no pattern is Unsupported.
    [[nodiscard]] TypeShape analyse(const TypeDecl& decl) const;

    /// Wither/getter pairs in method declaration order. Candidates that fail
    /// any rule are skipped individually.
    [[nodiscard]] immer::vector<CopyOperation> detect_copy_operations(const TypeDecl& decl) const;

    [[nodiscard]] bool detect_mutable_fields(const TypeDecl& decl) const;

    [[nodiscard]] const ContainerClassifier& classifier() const noexcept { return classifier_; }

private:
    [[nodiscard]] FieldDescriptor describe_field(std::string name, TypeRef type, std::string accessor) const;
    [[nodiscard]] std::optional<CopyOperation> pair_wither(const TypeDecl& decl, const MethodDecl& wither) const;

    const TypeIntrospector& types_;
    ContainerClassifier classifier_;
};

} // namespace opticsgen
