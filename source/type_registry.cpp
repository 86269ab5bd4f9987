// type_registry.cpp
// immer-backed declaration store and erasure-based subtype queries

#include <opticsgen/type_registry.h>

#include <deque>
#include <unordered_set>

namespace opticsgen {

TypeRegistry& TypeRegistry::add(TypeDecl decl)
{
    auto key = decl.qualified_name;
    types_ = types_.set(std::move(key), std::move(decl));
    return *this;
}

bool TypeRegistry::contains(std::string_view qualified_name) const
{
    return find(qualified_name) != nullptr;
}

const TypeDecl* TypeRegistry::find(std::string_view qualified_name) const
{
    return types_.find(std::string{qualified_name});
}

namespace {

bool permits(const TypeDecl& sealed_decl, const std::string& name)
{
    if (!sealed_decl.sealed) {
        return false;
    }
    for (const auto& permitted : sealed_decl.permitted_subtypes) {
        if (permitted.name == name) {
            return true;
        }
    }
    return false;
}

} // namespace

bool TypeRegistry::is_subtype(const TypeRef& sub, const TypeRef& super) const
{
    if (sub.kind != super.kind) {
        return false;
    }

    switch (sub.kind) {
    case TypeRefKind::Void:
        return true;
    case TypeRefKind::Array:
        return !sub.args.empty() && !super.args.empty() && is_subtype(sub.args.front(), super.args.front());
    case TypeRefKind::Primitive:
    case TypeRefKind::TypeVariable:
        return sub.name == super.name;
    case TypeRefKind::Declared:
        break;
    }

    if (sub.name == super.name) {
        return true;
    }

    const TypeDecl* super_decl = find(super.name);

    std::unordered_set<std::string> visited;
    std::deque<std::string> pending{sub.name};
    while (!pending.empty()) {
        auto current = std::move(pending.front());
        pending.pop_front();
        if (!visited.insert(current).second) {
            continue;
        }
        if (current == super.name) {
            return true;
        }
        if (super_decl && permits(*super_decl, current)) {
            return true;
        }
        if (const TypeDecl* decl = find(current)) {
            for (const auto& parent : decl->supertypes) {
                pending.push_back(parent.name);
            }
        }
    }
    return false;
}

} // namespace opticsgen
