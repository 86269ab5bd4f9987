// optics_generator.cpp
// Lens, prism, traversal and fold plans

#include <opticsgen/optics_generator.h>
#include <opticsgen/copy_strategy.h>
#include <opticsgen/diagnostics.h>
#include <opticsgen/naming.h>
#include <opticsgen/traversal_hint.h>

#include <unordered_set>

namespace opticsgen {

namespace {

/// Collects members and rejects a second member with the same name.
class MemberList {
public:
    explicit MemberList(std::string type_name)
        : type_name_(std::move(type_name))
    {
    }

    void add(Member member)
    {
        const auto& name = member_name(member);
        if (!names_.insert(name).second) {
            throw GenerationError(type_name_, name, "generated member '" + name + "' is declared twice");
        }
        members_.push_back(std::move(member));
    }

    [[nodiscard]] immer::vector<Member> finish() { return members_.persistent(); }

private:
    std::string type_name_;
    std::unordered_set<std::string> names_;
    immer::vector<Member>::transient_type members_ = immer::vector<Member>{}.transient();
};

CopyStrategyInfo positional_strategy(const TypeShape& shape)
{
    auto order = immer::vector<std::string>{}.transient();
    for (const auto& f : shape.fields()) {
        order.push_back(f.name);
    }
    return ViaConstructorStrategy{order.persistent()};
}

} // namespace

Expr field_lens(const TypeShape& shape, const FieldDescriptor& field)
{
    switch (shape.kind()) {
    case ShapeKind::Product:
        return resolve_lens(field.name, shape.type(), positional_strategy(shape));
    case ShapeKind::CopyMutable:
        for (const auto& op : shape.copy_operations()) {
            if (op.field_name == field.name) {
                return resolve_lens(field.name, shape.type(), WitherStrategy{op.getter_name, op.wither_name});
            }
        }
        break;
    case ShapeKind::Sum:
    case ShapeKind::Enumerated:
    case ShapeKind::Unsupported:
        break;
    }
    throw GenerationError(shape.type_name(), field.name, "no lens can be derived for this field");
}

OpticsGenerator::OpticsGenerator(const TypeIntrospector& types)
    : prisms_(types)
{
}

GeneratedClass OpticsGenerator::generate(const TypeShape& shape, const GeneratorOptions& options) const
{
    if (shape.has_mutable_fields() && !options.allow_mutable_fields) {
        throw GenerationError(shape.type_name(), {},
                              "type has mutable fields (setters); enable allowMutable to generate optics for it");
    }

    return shape.visit([&](const auto& s) -> GeneratedClass {
        using S = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<S, ProductShape> || std::is_same_v<S, CopyMutableShape>) {
            return generate_lenses(shape, options);
        } else if constexpr (std::is_same_v<S, SumShape> || std::is_same_v<S, EnumeratedShape>) {
            return generate_prisms(shape, options);
        } else {
            static_assert(std::is_same_v<S, UnsupportedShape>);
            throw GenerationError(shape.type_name(), {},
                                  "type is not supported: optics need a record, a sealed hierarchy, "
                                  "an enum or wither methods");
        }
    });
}

GeneratedClass OpticsGenerator::generate_lenses(const TypeShape& shape, const GeneratorOptions& options) const
{
    GeneratedClass generated{options.scope_for(shape.scope()), shape.simple_name() + "Lenses",
                             ClassOrigin::Lenses, shape.type(), {}};
    const auto owner = generated.qualified_name();
    const auto& self = shape.type();

    MemberList members{shape.type_name()};
    for (const auto& field : shape.fields()) {
        members.add(OpticMember{field.name, OpticKind::Lens, self, field.declared_type, field_lens(shape, field)});
    }

    for (const auto& field : shape.fields()) {
        members.add(UpdaterMember{"with" + capitalize(field.name), self, field.declared_type,
                                  expr::optic_set(expr::optic_ref(owner, field.name), expr::source(),
                                                  expr::new_value())});
    }

    for (const auto& field : shape.fields()) {
        if (!field.has_traversal()) {
            continue;
        }
        auto each = expr::compose(expr::optic_ref(owner, field.name),
                                  expr::traversal_ref(standard_traversal(field.container->kind)));
        members.add(OpticMember{field.name + "Traversal", OpticKind::Traversal, self, field.container->element, each});
        members.add(OpticMember{field.name + "Fold", OpticKind::Fold, self, field.container->element, each});
    }

    generated.members = members.finish();
    detail::log_info("OpticsGenerator", owner + ": " + std::to_string(generated.members.size()) + " member(s)");
    return generated;
}

GeneratedClass OpticsGenerator::generate_prisms(const TypeShape& shape, const GeneratorOptions& options) const
{
    GeneratedClass generated{options.scope_for(shape.scope()), shape.simple_name() + "Prisms",
                             ClassOrigin::Prisms, shape.type(), {}};
    const auto& self = shape.type();

    MemberList members{shape.type_name()};
    for (const auto& variant : shape.variants()) {
        members.add(OpticMember{decapitalize(variant.simple_name()), OpticKind::Prism, self, variant,
                                prisms_.resolve(InstanceOfHint{variant}, self, variant)});
    }
    for (const auto& constant : shape.constants()) {
        members.add(OpticMember{constant_to_camel(constant), OpticKind::Prism, self, self,
                                expr::prism(expr::constant_equals(expr::source(), self, constant),
                                            expr::source(),
                                            expr::new_value())});
    }

    generated.members = members.finish();
    detail::log_info("OpticsGenerator",
                     generated.qualified_name() + ": " + std::to_string(generated.members.size()) + " prism(s)");
    return generated;
}

GeneratedClass OpticsGenerator::generate_spec(const SpecAnalysis& spec, const GeneratorOptions& options) const
{
    GeneratedClass generated{options.scope_for(spec.scope), spec.generated_name(), ClassOrigin::Spec, spec.source, {}};
    const auto owner = generated.qualified_name();

    MemberList members{spec.spec_name};
    for (const auto& optic : spec.optics) {
        Expr body;
        switch (optic.kind) {
        case OpticKind::Lens:
            body = resolve_lens(optic.name, spec.source, optic.copy);
            break;
        case OpticKind::Prism:
            body = prisms_.resolve(optic.prism, spec.source, optic.focus);
            break;
        case OpticKind::Traversal:
        case OpticKind::Fold:
            body = resolve_traversal(optic.traversal, owner);
            break;
        case OpticKind::Affine:
        case OpticKind::Iso:
        case OpticKind::Getter:
            body = expr::unsupported(std::string{to_string(optic.kind)} + " optics are not yet supported");
            break;
        }
        members.add(OpticMember{optic.name, optic.kind, spec.source, optic.focus, std::move(body)});
    }

    for (const auto& method : spec.default_methods) {
        members.add(PlaceholderMember{method.name, method.return_type,
                                      "default method '" + method.name + "' is provided by " + spec.spec_name});
    }

    generated.members = members.finish();
    detail::log_info("OpticsGenerator", owner + ": generated from " + spec.spec_name);
    return generated;
}

} // namespace opticsgen
