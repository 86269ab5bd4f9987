// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file prism_hint.h
/// @brief Turns a declared prism hint into match/extract/review expressions.

#pragma once

#include <opticsgen/expr.h>
#include <opticsgen/strategies.h>

namespace opticsgen {

class OPTICSGEN_API PrismHintResolver {
public:
    explicit PrismHintResolver(const TypeIntrospector& types);

    /// PrismOf(matches, extract, review) from `sum_type` to `focus_type`.
    ///
    /// InstanceOf: the target (or the focus type when absent) must be a
    /// subtype of sum_type, otherwise GenerationError. MatchWhen: predicate
    /// and getter names are required, otherwise GenerationError.
    ///
    /// @throws UnresolvedStrategyError for NoPrismHint
    [[nodiscard]] Expr resolve(const PrismHintInfo& hint, const TypeRef& sum_type, const TypeRef& focus_type) const;

private:
    const TypeIntrospector& types_;
};

} // namespace opticsgen
