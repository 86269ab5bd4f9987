// type_shape.cpp
// Shape classification state machine and wither/setter scans

#include <opticsgen/type_shape.h>
#include <opticsgen/diagnostics.h>
#include <opticsgen/naming.h>

#include <array>
#include <unordered_set>

namespace opticsgen {

std::string_view to_string(ShapeKind kind) noexcept
{
    switch (kind) {
    case ShapeKind::Product:     return "Product";
    case ShapeKind::Sum:         return "Sum";
    case ShapeKind::Enumerated:  return "Enumerated";
    case ShapeKind::CopyMutable: return "CopyMutable";
    case ShapeKind::Unsupported: return "Unsupported";
    }
    return "?";
}

// ============================================================
// TypeShape
// ============================================================

TypeShape::TypeShape(TypeRef type, std::string scope, Variant shape)
    : type_(std::move(type))
    , scope_(std::move(scope))
    , shape_(std::move(shape))
{
}

immer::vector<FieldDescriptor> TypeShape::fields() const
{
    if (auto* product = std::get_if<ProductShape>(&shape_)) {
        return product->fields;
    }
    if (auto* copy = std::get_if<CopyMutableShape>(&shape_)) {
        return copy->fields;
    }
    return {};
}

immer::vector<TypeRef> TypeShape::variants() const
{
    if (auto* sum = std::get_if<SumShape>(&shape_)) {
        return sum->variants;
    }
    return {};
}

immer::vector<std::string> TypeShape::constants() const
{
    if (auto* enumerated = std::get_if<EnumeratedShape>(&shape_)) {
        return enumerated->constants;
    }
    return {};
}

immer::vector<CopyOperation> TypeShape::copy_operations() const
{
    if (auto* copy = std::get_if<CopyMutableShape>(&shape_)) {
        return copy->copy_operations;
    }
    return {};
}

bool TypeShape::supports_lens() const noexcept
{
    return kind() == ShapeKind::Product || kind() == ShapeKind::CopyMutable;
}

bool TypeShape::supports_prism() const noexcept
{
    return kind() == ShapeKind::Sum || kind() == ShapeKind::Enumerated;
}

bool TypeShape::has_mutable_fields() const noexcept
{
    if (auto* copy = std::get_if<CopyMutableShape>(&shape_)) {
        return copy->mutable_setters;
    }
    if (auto* unsupported = std::get_if<UnsupportedShape>(&shape_)) {
        return unsupported->mutable_setters;
    }
    return false;
}

// ============================================================
// TypeShapeAnalyser
// ============================================================

TypeShapeAnalyser::TypeShapeAnalyser(const TypeIntrospector& types, ContainerClassifier classifier)
    : types_(types)
    , classifier_(std::move(classifier))
{
}

FieldDescriptor TypeShapeAnalyser::describe_field(std::string name, TypeRef type, std::string accessor) const
{
    auto container = classifier_.classify(type);
    return FieldDescriptor{std::move(name), std::move(type), std::move(container), std::move(accessor)};
}

TypeShape TypeShapeAnalyser::analyse(const TypeDecl& decl) const
{
    auto self = decl.self_type();
    auto scope = decl.scope();

    if (decl.kind == DeclKind::Record) {
        auto fields = immer::vector<FieldDescriptor>{}.transient();
        for (const auto& component : decl.components) {
            fields.push_back(describe_field(component.name, component.type, component.name));
        }
        return TypeShape{std::move(self), std::move(scope), ProductShape{fields.persistent()}};
    }

    if (decl.sealed && (decl.kind == DeclKind::Interface || decl.kind == DeclKind::Class)) {
        auto variants = immer::vector<TypeRef>{}.transient();
        for (const auto& permitted : decl.permitted_subtypes) {
            variants.push_back(permitted);
        }
        return TypeShape{std::move(self), std::move(scope), SumShape{variants.persistent()}};
    }

    if (decl.kind == DeclKind::Enum) {
        auto constants = immer::vector<std::string>{}.transient();
        for (const auto& constant : decl.enum_constants) {
            constants.push_back(constant);
        }
        return TypeShape{std::move(self), std::move(scope), EnumeratedShape{constants.persistent()}};
    }

    auto operations = detect_copy_operations(decl);
    bool mutable_setters = detect_mutable_fields(decl);

    if (!operations.empty()) {
        auto fields = immer::vector<FieldDescriptor>{}.transient();
        for (const auto& op : operations) {
            fields.push_back(describe_field(op.field_name, op.field_type, op.getter_name));
        }
        detail::log_info("TypeShapeAnalyser",
                         decl.qualified_name + ": " + std::to_string(operations.size()) + " copy operation(s)");
        return TypeShape{std::move(self), std::move(scope),
                         CopyMutableShape{fields.persistent(), std::move(operations), mutable_setters}};
    }

    detail::log_info("TypeShapeAnalyser", decl.qualified_name + " is unsupported");
    return TypeShape{std::move(self), std::move(scope), UnsupportedShape{mutable_setters}};
}

std::optional<CopyOperation> TypeShapeAnalyser::pair_wither(const TypeDecl& decl, const MethodDecl& wither) const
{
    const auto& name = wither.name;
    if (name.size() <= kWitherPrefix.size() || !name.starts_with(kWitherPrefix)) {
        return std::nullopt;
    }
    if (!wither.modifiers.is_public || wither.modifiers.is_static || wither.params.size() != 1) {
        return std::nullopt;
    }
    if (!types_.is_subtype(wither.return_type.erasure(), decl.self_type().erasure())) {
        return std::nullopt;
    }

    const TypeRef& field_type = wither.params.front().type;
    auto suffix = std::string_view{name}.substr(kWitherPrefix.size());
    auto field = decapitalize(suffix);
    auto capitalised = capitalize(suffix);

    const std::array<std::string, 3> candidates{field, "get" + capitalised, "is" + capitalised};
    for (const auto& candidate : candidates) {
        const MethodDecl* getter = decl.find_method(candidate, 0);
        if (!getter || !getter->modifiers.is_public || getter->modifiers.is_static) {
            continue;
        }
        if (!types_.is_same_type(getter->return_type, field_type)) {
            continue;
        }
        return CopyOperation{getter->name, name, field, field_type};
    }
    return std::nullopt;
}

immer::vector<CopyOperation> TypeShapeAnalyser::detect_copy_operations(const TypeDecl& decl) const
{
    auto operations = immer::vector<CopyOperation>{}.transient();
    std::unordered_set<std::string> seen;
    for (const auto& method : decl.methods) {
        auto op = pair_wither(decl, method);
        // Overloaded withers for one field keep the first pairing
        if (op && seen.insert(op->field_name).second) {
            operations.push_back(std::move(*op));
        }
    }
    return operations.persistent();
}

bool TypeShapeAnalyser::detect_mutable_fields(const TypeDecl& decl) const
{
    for (const auto& method : decl.methods) {
        const auto& name = method.name;
        if (name.size() > kSetterPrefix.size() && name.starts_with(kSetterPrefix)
            && method.modifiers.is_public && !method.modifiers.is_static
            && method.params.size() == 1 && method.return_type.is_void()) {
            return true;
        }
    }
    return false;
}

} // namespace opticsgen
