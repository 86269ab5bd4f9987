// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file code_printer.h
/// @brief Renders generation plans as C++ source text built on lager lenses.
///
/// Rendering is a pure function of the plan; two equal plans print the same.

#pragma once

#include <opticsgen/generated.h>

#include <string>

namespace opticsgen {

/// Single-line rendering of an expression.
[[nodiscard]] OPTICSGEN_API std::string print_expr(const Expr& e);

/// Full class rendering, wrapped in its namespace.
[[nodiscard]] OPTICSGEN_API std::string print_class(const GeneratedClass& generated);

/// Sink that renders each class to text and keeps it by qualified name.
class OPTICSGEN_API TextCodeSink final : public CodeSink {
public:
    void write(const GeneratedClass& generated) override;

    [[nodiscard]] const std::string* find(std::string_view qualified_name) const;
    [[nodiscard]] immer::map<std::string, std::string> sources() const { return sources_; }

private:
    immer::map<std::string, std::string> sources_;
};

} // namespace opticsgen
