// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diagnostics.h
/// @brief Error types and stderr logging helpers.
///
/// Errors fall in three classes:
/// - GenerationError: the user's declarations cannot be turned into optics
///   (missing annotation, bad subtype, mutable type without opt-in, ...).
///   Reported once per offending declaration.
/// - UnresolvedStrategyError: a None strategy or hint reached code
///   generation. This is a defect in the caller and is never recovered.
/// - ConfigError: malformed generator options.

#pragma once

#include <opticsgen/opticsgen_config.h>
#include <opticsgen/api.h>

#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace opticsgen {

class OPTICSGEN_API GenerationError : public std::runtime_error {
public:
    GenerationError(std::string type_name, std::string member, const std::string& message);

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    [[nodiscard]] const std::string& member() const noexcept { return member_; }

private:
    std::string type_name_;
    std::string member_;
};

class OPTICSGEN_API UnresolvedStrategyError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class OPTICSGEN_API ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace detail {

inline void log_info(std::string_view component, std::string_view message) noexcept
{
#if OPTICSGEN_VERBOSE_LOG
    std::cerr << "[" << component << "] " << message << "\n";
#else
    (void)component;
    (void)message;
#endif
}

inline void log_warning(
    std::string_view component,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OPTICSGEN_VERBOSE_LOG
    std::cerr << "[" << component << "] Warning: " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)component;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail

} // namespace opticsgen
