// type_model.cpp
// TypeRef rendering and TypeDecl lookups

#include <opticsgen/type_model.h>
#include <opticsgen/naming.h>

#include <algorithm>

namespace opticsgen {

// ============================================================
// TypeRef
// ============================================================

TypeRef TypeRef::array_of(TypeRef component)
{
    TypeRef result{TypeRefKind::Array, {}, {}};
    result.args.push_back(std::move(component));
    return result;
}

TypeRef TypeRef::erasure() const
{
    if (is_array() && !args.empty()) {
        return array_of(args.front().erasure());
    }
    return TypeRef{kind, name, {}};
}

std::string TypeRef::simple_name() const
{
    if (is_array() && !args.empty()) {
        return args.front().simple_name() + "[]";
    }
    return simple_name_of(name);
}

std::string TypeRef::to_string() const
{
    switch (kind) {
    case TypeRefKind::Void:
        return "void";
    case TypeRefKind::Array:
        return (args.empty() ? std::string{"?"} : args.front().to_string()) + "[]";
    case TypeRefKind::Primitive:
    case TypeRefKind::TypeVariable:
        return name;
    case TypeRefKind::Declared:
        break;
    }

    std::string result = name;
    if (!args.empty()) {
        result += '<';
        for (std::size_t i = 0; i < args.size(); ++i) {
            if (i > 0) {
                result += ", ";
            }
            result += args[i].to_string();
        }
        result += '>';
    }
    return result;
}

// ============================================================
// AnnotationDecl
// ============================================================

std::string AnnotationDecl::string_value(std::string_view key) const
{
    auto it = values.find(key);
    if (it == values.end()) {
        return {};
    }
    if (auto* s = std::get_if<std::string>(&it->second)) {
        return *s;
    }
    return {};
}

std::vector<std::string> AnnotationDecl::list_value(std::string_view key) const
{
    auto it = values.find(key);
    if (it == values.end()) {
        return {};
    }
    if (auto* list = std::get_if<std::vector<std::string>>(&it->second)) {
        return *list;
    }
    // A single string is accepted where a list is expected
    if (auto* s = std::get_if<std::string>(&it->second); s && !s->empty()) {
        return {*s};
    }
    return {};
}

std::optional<TypeRef> AnnotationDecl::type_value(std::string_view key) const
{
    auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    if (auto* type = std::get_if<TypeRef>(&it->second)) {
        return *type;
    }
    return std::nullopt;
}

const AnnotationDecl* MethodDecl::find_annotation(std::string_view annotation) const noexcept
{
    auto it = std::find_if(annotations.begin(), annotations.end(),
                           [&](const AnnotationDecl& a) { return a.name == annotation; });
    return it == annotations.end() ? nullptr : &*it;
}

// ============================================================
// TypeDecl
// ============================================================

std::string TypeDecl::simple_name() const
{
    return simple_name_of(qualified_name);
}

std::string TypeDecl::scope() const
{
    return scope_of(qualified_name);
}

TypeRef TypeDecl::self_type() const
{
    std::vector<TypeRef> args;
    args.reserve(type_parameters.size());
    for (const auto& param : type_parameters) {
        args.push_back(TypeRef::variable(param));
    }
    return TypeRef::declared(qualified_name, std::move(args));
}

const MethodDecl* TypeDecl::find_method(std::string_view name, std::size_t arity) const noexcept
{
    for (const auto& method : methods) {
        if (method.name == name && method.params.size() == arity) {
            return &method;
        }
    }
    return nullptr;
}

const ComponentDecl* TypeDecl::find_component(std::string_view name) const noexcept
{
    for (const auto& component : components) {
        if (component.name == name) {
            return &component;
        }
    }
    return nullptr;
}

} // namespace opticsgen
