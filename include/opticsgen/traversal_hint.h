// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file traversal_hint.h
/// @brief Turns a declared traversal hint into a traversal expression.

#pragma once

#include <opticsgen/expr.h>
#include <opticsgen/strategies.h>

#include <string_view>

namespace opticsgen {

/// TraverseWith: the reference as given ("X::each()" is a call, "X::EACH" a
/// constant). ThroughField: Compose(OpticRef(owner, field), traversal), so
/// the owning class must provide a lens named after the field.
///
/// @throws GenerationError for an empty TraverseWith reference
/// @throws UnresolvedStrategyError for NoTraversalHint, or for ThroughField
///         whose traversal was neither declared nor auto-detected
[[nodiscard]] OPTICSGEN_API Expr resolve_traversal(const TraversalHintInfo& hint, std::string_view owner);

} // namespace opticsgen
