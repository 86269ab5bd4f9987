// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file naming.h
/// @brief Identifier helpers shared by analysis and generation.

#pragma once

#include <opticsgen/api.h>

#include <string>
#include <string_view>

namespace opticsgen {

/// Scope separator used in qualified names ("demo::model::Person").
inline constexpr std::string_view kScopeSeparator = "::";

/// "name" -> "Name"
[[nodiscard]] OPTICSGEN_API std::string capitalize(std::string_view name);

/// "Name" -> "name"
[[nodiscard]] OPTICSGEN_API std::string decapitalize(std::string_view name);

/// "DARK_BLUE" -> "darkBlue", "RED" -> "red"
[[nodiscard]] OPTICSGEN_API std::string constant_to_camel(std::string_view constant);

/// "demo::model::Person" -> "Person"
[[nodiscard]] OPTICSGEN_API std::string simple_name_of(std::string_view qualified_name);

/// "demo::model::Person" -> "demo::model", "Person" -> ""
[[nodiscard]] OPTICSGEN_API std::string scope_of(std::string_view qualified_name);

/// Joins a scope and a simple name, omitting the separator for the global scope.
[[nodiscard]] OPTICSGEN_API std::string qualify(std::string_view scope, std::string_view simple_name);

} // namespace opticsgen
