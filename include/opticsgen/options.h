// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file options.h
/// @brief Generator options and their key=value parsing.
///
/// Recognised keys (all prefixed with "opticsgen."):
///
/// | Key                 | Value               | Default              |
/// |---------------------|---------------------|----------------------|
/// | maxNavigatorDepth   | positive integer    | 1 (clamped to 10)    |
/// | includeFields       | comma separated     | all fields           |
/// | excludeFields       | comma separated     | none                 |
/// | allowMutable        | true / false        | false                |
/// | targetPackage       | qualified scope     | declaring scope      |
/// | generateNavigators  | true / false        | true                 |

#pragma once

#include <opticsgen/opticsgen_config.h>
#include <opticsgen/api.h>

#include <immer/set.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace opticsgen {

inline constexpr int kDefaultNavigatorDepth = 1;
inline constexpr int kMaxNavigatorDepth = 10;
inline constexpr std::string_view kOptionPrefix = "opticsgen.";

struct OPTICSGEN_API GeneratorOptions {
    int max_navigator_depth = kDefaultNavigatorDepth;
    immer::set<std::string> include_fields;
    immer::set<std::string> exclude_fields;
    bool allow_mutable_fields = false;
    std::string target_package;
    bool generate_navigators = true;

    /// Excluded fields never pass; otherwise a non-empty include list is
    /// required to name the field.
    [[nodiscard]] bool field_selected(const std::string& field) const;

    /// max_navigator_depth clamped to [1, kMaxNavigatorDepth].
    [[nodiscard]] int effective_depth() const noexcept;

    /// target_package, or `declaring_scope` when unset.
    [[nodiscard]] std::string scope_for(const std::string& declaring_scope) const;
};

/// Parses "opticsgen.<key>=<value>" arguments on top of the defaults.
/// @throws ConfigError for unknown keys, malformed values or a non-positive depth
[[nodiscard]] OPTICSGEN_API GeneratorOptions parse_options(const std::vector<std::string>& args);

} // namespace opticsgen
