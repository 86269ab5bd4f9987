// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file generated.h
/// @brief Generated artifacts and the sink that receives them.

#pragma once

#include <opticsgen/expr.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/vector.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace opticsgen {

enum class OpticKind : std::uint8_t {
    Lens,
    Prism,
    Traversal,
    Fold,
    Affine,
    Iso,
    Getter,
};

[[nodiscard]] OPTICSGEN_API std::string_view to_string(OpticKind kind) noexcept;

/// Widening order of navigation paths: Focus < Affine < Traversal.
enum class PathKind : std::uint8_t {
    Focus,     ///< exactly one focus
    Affine,    ///< zero or one focus
    Traversal, ///< zero or more foci
};

[[nodiscard]] OPTICSGEN_API std::string_view to_string(PathKind kind) noexcept;

/// The wider of two path kinds.
[[nodiscard]] constexpr PathKind widen(PathKind a, PathKind b) noexcept
{
    return static_cast<std::uint8_t>(a) >= static_cast<std::uint8_t>(b) ? a : b;
}

/// Operations a navigator exposes for a delegate path of the given kind.
[[nodiscard]] OPTICSGEN_API immer::vector<std::string> delegate_operations(PathKind kind);

// ============================================================
// Members
// ============================================================

/// Static optic factory, e.g. PersonLenses::name().
struct OpticMember {
    std::string name;
    OpticKind kind = OpticKind::Lens;
    TypeRef source;
    TypeRef focus;
    Expr body;

    friend bool operator==(const OpticMember&, const OpticMember&) = default;
};

/// with<Field>(source, newValue) convenience updater.
struct UpdaterMember {
    std::string name;
    TypeRef source;
    TypeRef value;
    Expr body;

    friend bool operator==(const UpdaterMember&, const UpdaterMember&) = default;
};

/// Declared member without a derivable body; raises when called.
struct PlaceholderMember {
    std::string name;
    TypeRef return_type;
    std::string message;

    friend bool operator==(const PlaceholderMember&, const PlaceholderMember&) = default;
};

/// Path accessor on a Focus class or a navigator. A navigable field
/// names the nested navigator class it returns.
struct FocusAccessor {
    std::string name;
    PathKind path_kind = PathKind::Focus;
    TypeRef focus;
    Expr path;
    std::optional<std::string> navigator;

    friend bool operator==(const FocusAccessor&, const FocusAccessor&) = default;
};

struct NavigatorClass;
using NavigatorBox = immer::box<NavigatorClass>;

/// Path wrapper parametrised by the original root type. Behaves as the
/// delegate path and adds one accessor per field of the target type.
struct NavigatorClass {
    std::string name;
    TypeRef root;
    TypeRef target;
    PathKind path_kind = PathKind::Focus;
    Expr delegate;
    immer::vector<std::string> operations;
    immer::vector<FocusAccessor> accessors;
    immer::vector<NavigatorBox> navigators;

    [[nodiscard]] const FocusAccessor* find_accessor(std::string_view accessor) const noexcept;
    [[nodiscard]] const NavigatorClass* find_navigator(std::string_view navigator) const noexcept;

    friend bool operator==(const NavigatorClass&, const NavigatorClass&) = default;
};

using Member = std::variant<OpticMember, UpdaterMember, PlaceholderMember, FocusAccessor, NavigatorClass>;

[[nodiscard]] OPTICSGEN_API const std::string& member_name(const Member& member) noexcept;

// ============================================================
// GeneratedClass
// ============================================================

enum class ClassOrigin : std::uint8_t {
    Lenses,
    Prisms,
    Focus,
    Spec,
};

struct OPTICSGEN_API GeneratedClass {
    std::string scope;
    std::string name;
    ClassOrigin origin = ClassOrigin::Lenses;
    TypeRef target;
    immer::vector<Member> members;

    [[nodiscard]] std::string qualified_name() const;

    [[nodiscard]] const Member* find(std::string_view member) const noexcept;

    template<typename T>
    [[nodiscard]] const T* find_as(std::string_view member) const noexcept
    {
        const Member* m = find(member);
        return m ? std::get_if<T>(m) : nullptr;
    }

    friend bool operator==(const GeneratedClass&, const GeneratedClass&) = default;
};

// ============================================================
// CodeSink
// ============================================================

/// Receives generated classes. The engine writes each class name at most
/// once per run.
class OPTICSGEN_API CodeSink {
public:
    virtual ~CodeSink() = default;
    virtual void write(const GeneratedClass& generated) = 0;
};

/// Keeps generated classes in memory, keyed by qualified name. A second
/// write for the same name raises GenerationError.
class OPTICSGEN_API MemoryCodeSink final : public CodeSink {
public:
    void write(const GeneratedClass& generated) override;

    [[nodiscard]] const GeneratedClass* find(std::string_view qualified_name) const;
    [[nodiscard]] std::size_t size() const noexcept { return classes_.size(); }
    [[nodiscard]] immer::map<std::string, GeneratedClass> classes() const { return classes_; }

private:
    immer::map<std::string, GeneratedClass> classes_;
};

} // namespace opticsgen
