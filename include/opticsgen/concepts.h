// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for type constraints in opticsgen.

#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>

namespace opticsgen {

/// Concept for string-like types that can be converted to std::string
template<typename T>
concept StringLike = std::is_same_v<std::decay_t<T>, std::string> ||
                     std::is_same_v<std::decay_t<T>, const char*> ||
                     std::is_convertible_v<T, std::string_view>;

/// Concept for a visitor that accepts every alternative of a closed set
template<typename V, typename... Alternatives>
concept ExhaustiveVisitor = (std::invocable<V, const Alternatives&> && ...);

} // namespace opticsgen
