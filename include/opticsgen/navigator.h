// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file navigator.h
/// @brief Focus classes with depth-limited navigators.
///
/// For a record type R the composer emits R + "Focus", holding one path
/// accessor per field of R. A field gets a navigator instead of a plain
/// accessor when all of the following hold:
///
/// - the field passes the include/exclude filter
/// - remaining navigation depth is above zero
/// - the field's type is itself a record (Product shape)
/// - the field's type is not already being navigated on the current chain
///
/// A navigator is parametrised by R, wraps the delegate path R -> field and
/// repeats the decision for the fields of its target with one less level
/// of depth. Failing any condition downgrades to a plain accessor; it is
/// never an error.
///
/// @code
/// // max depth 2, Company -> Address -> Street
/// CompanyFocus::address()              // AddressNavigator<Company>
/// CompanyFocus::address().street()     // StreetNavigator<Company>
/// CompanyFocus::address().street().name()   // plain FocusPath<Company, std::string>
/// @endcode

#pragma once

#include <opticsgen/generated.h>
#include <opticsgen/options.h>
#include <opticsgen/type_shape.h>

#include <string>
#include <vector>

namespace opticsgen {

/// Bounded stack of type names on the current navigation chain.
class OPTICSGEN_API RecursionGuard {
public:
    explicit RecursionGuard(std::size_t capacity);

    /// False when the stack is full. A type may appear more than once.
    [[nodiscard]] bool try_push(const std::string& type_name);
    void pop();

    [[nodiscard]] std::size_t size() const noexcept { return stack_.size(); }

private:
    std::size_t capacity_;
    std::vector<std::string> stack_;
};

class OPTICSGEN_API NavigatorComposer {
public:
    NavigatorComposer(const TypeIntrospector& types, const TypeShapeAnalyser& analyser);

    /// @throws GenerationError when the root is not a record
    [[nodiscard]] GeneratedClass compose(const TypeShape& root, const GeneratorOptions& options) const;

private:
    struct Level;

    void add_field(Level& level, const TypeShape& owner, const FieldDescriptor& field, const Expr& base,
                   int remaining) const;
    [[nodiscard]] std::optional<TypeShape> navigable_target(const FieldDescriptor& field) const;
    [[nodiscard]] static std::string navigator_name(const Level& level, const FieldDescriptor& field);

    const TypeIntrospector& types_;
    const TypeShapeAnalyser& analyser_;
};

} // namespace opticsgen
