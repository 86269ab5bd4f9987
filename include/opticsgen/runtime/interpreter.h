// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file interpreter.h
/// @brief Executes generation plans against dynamic objects.
///
/// The interpreter gives generated expressions the meaning the emitted code
/// would have, so plans can be checked for the optic laws without compiling
/// the emitted text. Lenses become lager::lens<Object, Object>, composed
/// with zug::comp exactly like hand-written lager lenses.
///
/// Built-in record methods, tried after user-defined methods:
///
/// | Call                | Meaning                                 |
/// |---------------------|-----------------------------------------|
/// | r.f() / getF / isF  | read field f                            |
/// | r.withF(v)          | copy of r with f = v                    |
/// | r.setF(v)           | r with f = v (value semantics)          |
/// | r.toBuilder()       | builder holding r's fields              |
/// | b.f(v)              | builder with f = v                      |
/// | b.build()           | record from the builder                 |
///
/// Optics produced here capture the interpreter by reference; the
/// interpreter must outlive them.

#pragma once

#include <opticsgen/generated.h>
#include <opticsgen/runtime/object.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>

#include <immer/map.hpp>

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace opticsgen::runtime {

/// Raised by generated code paths that were emitted as placeholders.
class OPTICSGEN_API UnsupportedOperation : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using ObjectLens = lager::lens<Object, Object>;

struct ObjectPrism {
    std::function<std::optional<Object>(const Object&)> preview;
    std::function<Object(const Object&)> review;
};

struct ObjectTraversal {
    std::function<std::vector<Object>(const Object&)> get_all;
    std::function<Object(const Object&, const std::function<Object(const Object&)>&)> modify;
};

/// Bindings of the two implicit variables of an expression.
struct Env {
    Object source;
    Object new_value;
};

/// User-defined method; mutating methods return the updated receiver.
using Method = std::function<Object(const Object& self, const std::vector<Object>& args)>;

class OPTICSGEN_API Interpreter {
public:
    explicit Interpreter(const TypeIntrospector& types);

    /// Methods are looked up on the receiver's type, then its supertypes.
    Interpreter& define_method(const std::string& type, const std::string& method, Method fn);

    /// Makes a custom traversal reference (without "()") resolvable.
    Interpreter& define_traversal(const std::string& reference, ObjectTraversal traversal);

    /// Makes the members of a generated class resolvable through OpticRef.
    Interpreter& add_class(const GeneratedClass& generated);

    [[nodiscard]] Object evaluate(const Expr& e, const Env& env) const;

    /// @throws std::invalid_argument when `optic` does not denote a lens
    [[nodiscard]] ObjectLens lens(const Expr& optic) const;
    [[nodiscard]] ObjectPrism prism(const Expr& optic) const;
    /// Lenses and prisms are accepted and viewed as traversals.
    [[nodiscard]] ObjectTraversal traversal(const Expr& optic) const;

    /// Optic members of classes passed to add_class().
    [[nodiscard]] const OpticMember& optic(const std::string& owner, const std::string& member) const;
    [[nodiscard]] ObjectLens lens(const std::string& owner, const std::string& member) const;

    /// Calls a with-updater member.
    [[nodiscard]] Object update(const UpdaterMember& updater, Object source, Object value) const;

private:
    [[nodiscard]] Object dispatch(const Object& receiver, const std::string& method,
                                  const std::vector<Object>& args) const;
    [[nodiscard]] const Method* find_method(const std::string& type, const std::string& method) const;
    [[nodiscard]] Object construct(const TypeRef& type, const std::vector<Object>& args) const;
    /// Copy constructor call: the copy is a record of `type` with the fields of `original`.
    [[nodiscard]] Object copy_as(const TypeRef& type, const Object& original) const;
    [[nodiscard]] bool instance_of(const Object& value, const TypeRef& type) const;
    [[nodiscard]] ObjectTraversal standard_traversal(const TraversalRef& ref) const;

    const TypeIntrospector& types_;
    immer::map<std::string, Method> methods_;
    immer::map<std::string, ObjectTraversal> traversals_;
    immer::map<std::string, OpticMember> optics_;
};

} // namespace opticsgen::runtime
