// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file object.h
/// @brief Dynamic values the plan interpreter evaluates generated code against.
///
/// Object is an immutable tree in the style of a JSON value, with two
/// extra node kinds for the shapes optics are derived from:
///
/// - Record:    a typed product; fields keyed by name, type is the
///              qualified name of its declaration
/// - EnumValue: one constant of an enumeration
///
/// std::monostate doubles as the empty optional; any other value is a
/// present optional.

#pragma once

#include <opticsgen/opticsgen_config.h>
#include <opticsgen/api.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/vector.hpp>

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <utility>
#include <variant>

namespace opticsgen::runtime {

struct Object;
using ObjectBox = immer::box<Object>;
using ObjectList = immer::vector<ObjectBox>;
using ObjectMap = immer::map<std::string, ObjectBox>;

struct EnumValue {
    std::string type;
    std::string constant;

    friend bool operator==(const EnumValue&, const EnumValue&) = default;
};

struct Record {
    std::string type;
    ObjectMap fields;
    bool builder = false; ///< intermediate value between toBuilder() and build()

    friend bool operator==(const Record&, const Record&) = default;
};

struct OPTICSGEN_API Object {
    using Data = std::variant<std::monostate, bool, std::int64_t, double, std::string, EnumValue, Record,
                              ObjectList, ObjectMap>;

    Data data;

    Object() = default;
    Object(bool b) : data(b) {}
    Object(int i) : data(static_cast<std::int64_t>(i)) {}
    Object(std::int64_t i) : data(i) {}
    Object(double d) : data(d) {}
    Object(const char* s) : data(std::string{s}) {}
    Object(std::string s) : data(std::move(s)) {}
    Object(EnumValue e) : data(std::move(e)) {}
    Object(Record r) : data(std::move(r)) {}
    Object(ObjectList l) : data(std::move(l)) {}
    Object(ObjectMap m) : data(std::move(m)) {}

    [[nodiscard]] static Object record(std::string type,
                                       std::initializer_list<std::pair<std::string, Object>> fields);
    [[nodiscard]] static Object list(std::initializer_list<Object> items);
    [[nodiscard]] static Object map(std::initializer_list<std::pair<std::string, Object>> entries);
    [[nodiscard]] static Object enumeration(std::string type, std::string constant);

    template<typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data); }

    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data); }

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }

    /// Record field; null when absent or not a record.
    [[nodiscard]] Object field(const std::string& name) const;

    /// Copy with one record field replaced.
    /// @throws std::invalid_argument when not a record
    [[nodiscard]] Object with_field(const std::string& name, Object value) const;

    /// Qualified type name of a Record or EnumValue, empty otherwise.
    [[nodiscard]] std::string type_name() const;

    friend bool operator==(const Object&, const Object&) = default;
};

[[nodiscard]] OPTICSGEN_API std::string to_string(const Object& object);
OPTICSGEN_API std::ostream& operator<<(std::ostream& os, const Object& object);

} // namespace opticsgen::runtime
