// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_registry.h
/// @brief In-memory TypeIntrospector.
///
/// Holds declarations in an immer::map keyed by qualified name. Copies are
/// cheap and share structure, so a registry can be snapshotted and handed
/// to analyses running on other threads.

#pragma once

#include <opticsgen/type_model.h>

#include <immer/map.hpp>

#include <string>

namespace opticsgen {

class OPTICSGEN_API TypeRegistry final : public TypeIntrospector {
public:
    TypeRegistry() = default;

    /// Adds or replaces a declaration.
    TypeRegistry& add(TypeDecl decl);

    [[nodiscard]] std::size_t size() const noexcept { return types_.size(); }
    [[nodiscard]] bool contains(std::string_view qualified_name) const;

    [[nodiscard]] const TypeDecl* find(std::string_view qualified_name) const override;

    /// Walks declared supertypes and the permitted-subtype lists of sealed
    /// declarations. Arrays are covariant in their component.
    [[nodiscard]] bool is_subtype(const TypeRef& sub, const TypeRef& super) const override;

private:
    immer::map<std::string, TypeDecl> types_;
};

} // namespace opticsgen
