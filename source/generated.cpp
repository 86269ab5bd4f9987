// generated.cpp
// Generated artifact lookups and the in-memory sink

#include <opticsgen/generated.h>
#include <opticsgen/diagnostics.h>
#include <opticsgen/naming.h>

namespace opticsgen {

std::string_view to_string(OpticKind kind) noexcept
{
    switch (kind) {
    case OpticKind::Lens:      return "Lens";
    case OpticKind::Prism:     return "Prism";
    case OpticKind::Traversal: return "Traversal";
    case OpticKind::Fold:      return "Fold";
    case OpticKind::Affine:    return "Affine";
    case OpticKind::Iso:       return "Iso";
    case OpticKind::Getter:    return "Getter";
    }
    return "?";
}

std::string_view to_string(PathKind kind) noexcept
{
    switch (kind) {
    case PathKind::Focus:     return "FocusPath";
    case PathKind::Affine:    return "AffinePath";
    case PathKind::Traversal: return "TraversalPath";
    }
    return "?";
}

immer::vector<std::string> delegate_operations(PathKind kind)
{
    switch (kind) {
    case PathKind::Focus:
        return {"get", "set", "modify", "toLens", "toPath"};
    case PathKind::Affine:
        return {"getOptional", "set", "modify", "matches", "toPath"};
    case PathKind::Traversal:
        return {"getAll", "setAll", "modifyAll", "count", "isEmpty", "toPath"};
    }
    return {};
}

const FocusAccessor* NavigatorClass::find_accessor(std::string_view accessor) const noexcept
{
    for (const auto& a : accessors) {
        if (a.name == accessor) {
            return &a;
        }
    }
    return nullptr;
}

const NavigatorClass* NavigatorClass::find_navigator(std::string_view navigator) const noexcept
{
    for (const auto& n : navigators) {
        if (n->name == navigator) {
            return &n.get();
        }
    }
    return nullptr;
}

const std::string& member_name(const Member& member) noexcept
{
    return std::visit([](const auto& m) -> const std::string& { return m.name; }, member);
}

std::string GeneratedClass::qualified_name() const
{
    return qualify(scope, name);
}

const Member* GeneratedClass::find(std::string_view member) const noexcept
{
    for (const auto& m : members) {
        if (member_name(m) == member) {
            return &m;
        }
    }
    return nullptr;
}

void MemoryCodeSink::write(const GeneratedClass& generated)
{
    auto name = generated.qualified_name();
    if (classes_.find(name)) {
        throw GenerationError(generated.target.name, generated.name,
                              "generated class '" + name + "' was already written");
    }
    classes_ = classes_.set(std::move(name), generated);
}

const GeneratedClass* MemoryCodeSink::find(std::string_view qualified_name) const
{
    return classes_.find(std::string{qualified_name});
}

} // namespace opticsgen
