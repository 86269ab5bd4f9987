// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file strategies.h
/// @brief Declared strategies for types the engine does not control.
///
/// Each strategy is a closed tagged union whose "None" alternative is an
/// explicit sentinel. A None reaching code generation is a programming
/// error (UnresolvedStrategyError), never a silent default.

#pragma once

#include <opticsgen/type_model.h>

#include <immer/vector.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace opticsgen {

// ============================================================
// Copy strategies (Lens setters)
// ============================================================

enum class CopyStrategyKind : std::uint8_t {
    None,
    ViaBuilder,
    Wither,
    ViaConstructor,
    ViaCopyAndSet,
};

[[nodiscard]] OPTICSGEN_API std::string_view to_string(CopyStrategyKind kind) noexcept;

struct NoCopyStrategy {
    friend bool operator==(const NoCopyStrategy&, const NoCopyStrategy&) = default;
};

/// source.to_builder().setter(newValue).build(). Blank names take defaults.
struct ViaBuilderStrategy {
    std::string getter;
    std::string to_builder;
    std::string setter;
    std::string build;

    friend bool operator==(const ViaBuilderStrategy&, const ViaBuilderStrategy&) = default;
};

struct WitherStrategy {
    std::string getter;
    std::string wither;

    friend bool operator==(const WitherStrategy&, const WitherStrategy&) = default;
};

/// Positional constructor; parameter_order names every constructor argument.
struct ViaConstructorStrategy {
    immer::vector<std::string> parameter_order;

    friend bool operator==(const ViaConstructorStrategy&, const ViaConstructorStrategy&) = default;
};

/// Copy-construct then call the setter on the copy.
struct ViaCopyAndSetStrategy {
    std::string copy_constructor; ///< qualified type name; blank means the source type
    std::string setter;

    friend bool operator==(const ViaCopyAndSetStrategy&, const ViaCopyAndSetStrategy&) = default;
};

using CopyStrategyInfo =
    std::variant<NoCopyStrategy, ViaBuilderStrategy, WitherStrategy, ViaConstructorStrategy, ViaCopyAndSetStrategy>;

[[nodiscard]] inline CopyStrategyKind kind_of(const CopyStrategyInfo& info) noexcept
{
    return static_cast<CopyStrategyKind>(info.index());
}

/// Explicit getter override carried by the strategy, empty when none.
[[nodiscard]] OPTICSGEN_API std::string getter_override(const CopyStrategyInfo& info);

// ============================================================
// Prism hints
// ============================================================

enum class PrismHintKind : std::uint8_t {
    None,
    InstanceOf,
    MatchWhen,
};

struct NoPrismHint {
    friend bool operator==(const NoPrismHint&, const NoPrismHint&) = default;
};

/// Subtype test. Without a target the prism's focus type is tested.
struct InstanceOfHint {
    std::optional<TypeRef> target;

    friend bool operator==(const InstanceOfHint&, const InstanceOfHint&) = default;
};

/// Predicate method plus extractor method on the source.
struct MatchWhenHint {
    std::string predicate;
    std::string getter;

    friend bool operator==(const MatchWhenHint&, const MatchWhenHint&) = default;
};

using PrismHintInfo = std::variant<NoPrismHint, InstanceOfHint, MatchWhenHint>;

[[nodiscard]] inline PrismHintKind kind_of(const PrismHintInfo& info) noexcept
{
    return static_cast<PrismHintKind>(info.index());
}

// ============================================================
// Traversal hints
// ============================================================

enum class TraversalHintKind : std::uint8_t {
    None,
    TraverseWith,
    ThroughField,
};

struct NoTraversalHint {
    friend bool operator==(const NoTraversalHint&, const NoTraversalHint&) = default;
};

/// Reference to an existing traversal, either a call "X::each()" or a constant "X::EACH".
struct TraverseWithHint {
    std::string reference;

    friend bool operator==(const TraverseWithHint&, const TraverseWithHint&) = default;
};

/// Traverse the elements of one field. An empty traversal is auto-detected
/// from the field's container type before generation.
struct ThroughFieldHint {
    std::string field;
    std::string traversal;

    friend bool operator==(const ThroughFieldHint&, const ThroughFieldHint&) = default;
};

using TraversalHintInfo = std::variant<NoTraversalHint, TraverseWithHint, ThroughFieldHint>;

[[nodiscard]] inline TraversalHintKind kind_of(const TraversalHintInfo& info) noexcept
{
    return static_cast<TraversalHintKind>(info.index());
}

} // namespace opticsgen
