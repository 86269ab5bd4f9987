// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file container_classifier.h
/// @brief Recognises the container shapes that carry a standard traversal.
///
/// Five shapes are recognised: List, Set, Map, Optional and Array. A shape
/// is recognised only when fully parameterised: one type argument for
/// List, Set and Optional, two for Map. Raw usages and unknown families are
/// not containers.

#pragma once

#include <opticsgen/type_model.h>

#include <immer/map.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace opticsgen {

enum class ContainerKind : std::uint8_t {
    List,
    Set,
    Map,
    Optional,
    Array,
};

[[nodiscard]] OPTICSGEN_API std::string_view to_string(ContainerKind kind) noexcept;

/// A recognised container usage.
struct OPTICSGEN_API ContainerType {
    ContainerKind kind = ContainerKind::List;
    TypeRef element;            ///< value type for Map
    std::optional<TypeRef> key; ///< Map only

    [[nodiscard]] bool is_map() const noexcept { return kind == ContainerKind::Map; }

    friend bool operator==(const ContainerType&, const ContainerType&) = default;
};

/// Reference to the standard traversal for a container kind. The mapping
/// is injective; every reference is a call ("...for_list()").
[[nodiscard]] OPTICSGEN_API std::string_view standard_traversal(ContainerKind kind) noexcept;

class OPTICSGEN_API ContainerClassifier {
public:
    /// Uses the default family table (standard library and immer containers).
    ContainerClassifier();

    /// Registers another qualified name for a family, e.g. a project's own
    /// list type. Array cannot be registered; it is a type-level kind.
    ContainerClassifier& add_family(std::string qualified_name, ContainerKind kind);

    [[nodiscard]] std::optional<ContainerType> classify(const TypeRef& type) const;

    /// Like classify(), but also accepts a declared type one of whose
    /// supertypes is a known family, e.g. a custom list deriving from
    /// std::vector<T>. Type parameters are bound at any nesting depth of the
    /// supertype arguments. Raw usages are still refused.
    [[nodiscard]] std::optional<ContainerType> classify_with_subtypes(const TypeRef& type,
                                                                       const TypeIntrospector& types) const;

private:
    [[nodiscard]] std::optional<ContainerKind> family_of(const std::string& name) const;
    [[nodiscard]] std::optional<ContainerType> classify_in_hierarchy(const TypeRef& type,
                                                                      const TypeIntrospector& types,
                                                                      std::unordered_set<std::string>& visited) const;

    immer::map<std::string, ContainerKind> families_;
};

} // namespace opticsgen
