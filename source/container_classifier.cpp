// container_classifier.cpp
// Container family table and standard traversal references

#include <opticsgen/container_classifier.h>

#include <unordered_set>

namespace opticsgen {

std::string_view to_string(ContainerKind kind) noexcept
{
    switch (kind) {
    case ContainerKind::List:     return "List";
    case ContainerKind::Set:      return "Set";
    case ContainerKind::Map:      return "Map";
    case ContainerKind::Optional: return "Optional";
    case ContainerKind::Array:    return "Array";
    }
    return "?";
}

std::string_view standard_traversal(ContainerKind kind) noexcept
{
    switch (kind) {
    case ContainerKind::List:     return "opticsgen::traversals::for_list()";
    case ContainerKind::Set:      return "opticsgen::traversals::for_set()";
    case ContainerKind::Map:      return "opticsgen::traversals::for_map_values()";
    case ContainerKind::Optional: return "opticsgen::traversals::for_optional()";
    case ContainerKind::Array:    return "opticsgen::traversals::for_array()";
    }
    return {};
}

ContainerClassifier::ContainerClassifier()
{
    for (auto* name : {"std::vector", "std::list", "std::deque", "immer::vector", "immer::flex_vector"}) {
        families_ = families_.set(name, ContainerKind::List);
    }
    for (auto* name : {"std::set", "std::unordered_set", "immer::set"}) {
        families_ = families_.set(name, ContainerKind::Set);
    }
    for (auto* name : {"std::map", "std::unordered_map", "immer::map"}) {
        families_ = families_.set(name, ContainerKind::Map);
    }
    families_ = families_.set("std::optional", ContainerKind::Optional);
}

ContainerClassifier& ContainerClassifier::add_family(std::string qualified_name, ContainerKind kind)
{
    if (kind != ContainerKind::Array) {
        families_ = families_.set(std::move(qualified_name), kind);
    }
    return *this;
}

std::optional<ContainerKind> ContainerClassifier::family_of(const std::string& name) const
{
    if (const auto* kind = families_.find(name)) {
        return *kind;
    }
    return std::nullopt;
}

namespace {

std::optional<ContainerType> shape_for(ContainerKind kind, const TypeRef& type)
{
    switch (kind) {
    case ContainerKind::Map:
        if (type.args.size() != 2) {
            return std::nullopt;
        }
        return ContainerType{kind, type.args[1], type.args[0]};
    case ContainerKind::List:
    case ContainerKind::Set:
    case ContainerKind::Optional:
        if (type.args.size() != 1) {
            return std::nullopt;
        }
        return ContainerType{kind, type.args[0], std::nullopt};
    case ContainerKind::Array:
        break;
    }
    return std::nullopt;
}

/// Replaces type variables named in params, at any nesting level, with the
/// matching entry of args.
TypeRef substitute(const TypeRef& type, const std::vector<std::string>& params, const std::vector<TypeRef>& args)
{
    if (type.kind == TypeRefKind::TypeVariable) {
        for (std::size_t i = 0; i < params.size(); ++i) {
            if (params[i] == type.name) {
                return args[i];
            }
        }
        return type;
    }
    TypeRef bound = type;
    for (auto& arg : bound.args) {
        arg = substitute(arg, params, args);
    }
    return bound;
}

} // namespace

std::optional<ContainerType> ContainerClassifier::classify(const TypeRef& type) const
{
    if (type.is_array()) {
        if (type.args.size() != 1) {
            return std::nullopt;
        }
        return ContainerType{ContainerKind::Array, type.args.front(), std::nullopt};
    }
    if (!type.is_declared()) {
        return std::nullopt;
    }
    if (auto kind = family_of(type.name)) {
        return shape_for(*kind, type);
    }
    return std::nullopt;
}

std::optional<ContainerType> ContainerClassifier::classify_with_subtypes(const TypeRef& type,
                                                                         const TypeIntrospector& types) const
{
    std::unordered_set<std::string> visited;
    return classify_in_hierarchy(type, types, visited);
}

std::optional<ContainerType> ContainerClassifier::classify_in_hierarchy(const TypeRef& type,
                                                                        const TypeIntrospector& types,
                                                                        std::unordered_set<std::string>& visited) const
{
    if (auto direct = classify(type)) {
        return direct;
    }
    if (!type.is_declared() || !visited.insert(type.name).second) {
        return std::nullopt;
    }

    // Supertype arguments are written in terms of the declaration's own
    // type parameters; a raw usage leaves them unbound and is refused.
    const TypeDecl* decl = types.find(type.name);
    if (!decl || decl->type_parameters.size() != type.args.size()) {
        return std::nullopt;
    }

    for (const auto& parent : decl->supertypes) {
        TypeRef bound = substitute(parent, decl->type_parameters, type.args);
        if (auto found = classify_in_hierarchy(bound, types, visited)) {
            return found;
        }
    }
    return std::nullopt;
}

} // namespace opticsgen
