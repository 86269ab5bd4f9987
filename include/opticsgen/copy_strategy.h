// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file copy_strategy.h
/// @brief Turns a declared copy strategy into Lens getter/setter expressions.
///
/// Setter expressions are written in terms of SourceRef and NewValueRef:
///
/// | Strategy       | Setter                                                   |
/// |----------------|----------------------------------------------------------|
/// | ViaBuilder     | source.toBuilder().field(newValue).build()               |
/// | Wither         | source.withField(newValue)                               |
/// | ViaConstructor | Type(source.a(), newValue, source.c())  (declared order) |
/// | ViaCopyAndSet  | copy = Type(source); copy.setField(newValue)             |
/// | None           | UnresolvedStrategyError                                  |
///
/// ViaConstructor with an empty parameter order yields an Unsupported node:
/// generation succeeds and the generated setter raises when invoked.

#pragma once

#include <opticsgen/expr.h>
#include <opticsgen/strategies.h>

#include <string_view>

namespace opticsgen {

inline constexpr std::string_view kDefaultToBuilder = "toBuilder";
inline constexpr std::string_view kDefaultBuild = "build";

/// source.getter() where getter is the explicit override or the field name.
[[nodiscard]] OPTICSGEN_API Expr resolve_getter(std::string_view field, const CopyStrategyInfo& info);

/// @throws UnresolvedStrategyError for NoCopyStrategy
[[nodiscard]] OPTICSGEN_API Expr resolve_setter(std::string_view field, const TypeRef& source_type,
                                                const CopyStrategyInfo& info);

/// LensOf(resolve_getter, resolve_setter)
[[nodiscard]] OPTICSGEN_API Expr resolve_lens(std::string_view field, const TypeRef& source_type,
                                              const CopyStrategyInfo& info);

} // namespace opticsgen
