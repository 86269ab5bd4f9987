// spec_analyser.cpp
// Spec interface validation and annotation parsing

#include <opticsgen/spec_analyser.h>
#include <opticsgen/diagnostics.h>
#include <opticsgen/naming.h>

#include <array>
#include <optional>
#include <utility>

namespace opticsgen {

namespace {

constexpr std::array<std::pair<std::string_view, OpticKind>, 7> kOpticFamilies{{
    {"opticsgen::Lens", OpticKind::Lens},
    {"opticsgen::Prism", OpticKind::Prism},
    {"opticsgen::Traversal", OpticKind::Traversal},
    {"opticsgen::Fold", OpticKind::Fold},
    {"opticsgen::Affine", OpticKind::Affine},
    {"opticsgen::Iso", OpticKind::Iso},
    {"opticsgen::Getter", OpticKind::Getter},
}};

std::optional<OpticKind> optic_family(const TypeRef& type)
{
    if (!type.is_declared()) {
        return std::nullopt;
    }
    for (const auto& [name, kind] : kOpticFamilies) {
        if (type.name == name) {
            return kind;
        }
    }
    return std::nullopt;
}

std::optional<CopyStrategyInfo> read_copy_strategy(const MethodDecl& method)
{
    namespace a = annotations;
    if (auto* ann = method.find_annotation(a::kViaBuilder)) {
        return ViaBuilderStrategy{ann->string_value("getter"), ann->string_value("toBuilder"),
                                  ann->string_value("setter"), ann->string_value("build")};
    }
    if (auto* ann = method.find_annotation(a::kWither)) {
        return WitherStrategy{ann->string_value("getter"), ann->string_value("value")};
    }
    if (auto* ann = method.find_annotation(a::kViaConstructor)) {
        auto order = immer::vector<std::string>{}.transient();
        for (auto& param : ann->list_value("parameterOrder")) {
            order.push_back(std::move(param));
        }
        return ViaConstructorStrategy{order.persistent()};
    }
    if (auto* ann = method.find_annotation(a::kViaCopyAndSet)) {
        return ViaCopyAndSetStrategy{ann->string_value("copyConstructor"), ann->string_value("setter")};
    }
    return std::nullopt;
}

std::optional<PrismHintInfo> read_prism_hint(const MethodDecl& method)
{
    if (auto* ann = method.find_annotation(annotations::kInstanceOf)) {
        return InstanceOfHint{ann->type_value("value")};
    }
    if (auto* ann = method.find_annotation(annotations::kMatchWhen)) {
        return MatchWhenHint{ann->string_value("predicate"), ann->string_value("getter")};
    }
    return std::nullopt;
}

std::optional<TraversalHintInfo> read_traversal_hint(const MethodDecl& method)
{
    if (auto* ann = method.find_annotation(annotations::kTraverseWith)) {
        return TraverseWithHint{ann->string_value("value")};
    }
    if (auto* ann = method.find_annotation(annotations::kThroughField)) {
        return ThroughFieldHint{ann->string_value("field"), ann->string_value("traversal")};
    }
    return std::nullopt;
}

/// Declared type of a field of `decl`: record component, accessor method or public field.
std::optional<TypeRef> field_type(const TypeDecl& decl, const std::string& field)
{
    if (auto* component = decl.find_component(field)) {
        return component->type;
    }
    auto capitalised = capitalize(field);
    for (const auto& accessor : {field, "get" + capitalised, "is" + capitalised}) {
        const MethodDecl* method = decl.find_method(accessor, 0);
        if (method && method->modifiers.is_public && !method->modifiers.is_static) {
            return method->return_type;
        }
    }
    for (const auto& public_field : decl.public_fields) {
        if (public_field.name == field) {
            return public_field.type;
        }
    }
    return std::nullopt;
}

} // namespace

// ============================================================
// SpecAnalysis
// ============================================================

std::string SpecAnalysis::generated_name() const
{
    constexpr std::string_view suffix = "Spec";
    auto simple = simple_name_of(spec_name);
    if (simple.size() > suffix.size() && std::string_view{simple}.ends_with(suffix)) {
        return simple.substr(0, simple.size() - suffix.size());
    }
    return simple + "Impl";
}

const SpecOptic* SpecAnalysis::find(std::string_view optic) const noexcept
{
    for (const auto& o : optics) {
        if (o.name == optic) {
            return &o;
        }
    }
    return nullptr;
}

// ============================================================
// SpecAnalyser
// ============================================================

SpecAnalyser::SpecAnalyser(const TypeIntrospector& types, ContainerClassifier classifier)
    : types_(types)
    , classifier_(std::move(classifier))
{
}

SpecAnalysis SpecAnalyser::analyse(const TypeDecl& spec) const
{
    const auto& spec_name = spec.qualified_name;
    if (spec.kind != DeclKind::Interface) {
        throw GenerationError(spec_name, {}, "an optics spec must be an interface");
    }

    std::optional<TypeRef> source;
    for (const auto& parent : spec.supertypes) {
        if (parent.name == kOpticsSpecBase) {
            if (parent.args.size() != 1) {
                throw GenerationError(spec_name, {}, "OpticsSpec must be parameterised with its source type");
            }
            source = parent.args.front();
        }
    }
    if (!source) {
        throw GenerationError(spec_name, {}, "an optics spec must derive from " + std::string{kOpticsSpecBase});
    }

    SpecAnalysis analysis{spec_name, spec.scope(), *source, {}, {}};
    auto optics = immer::vector<SpecOptic>{}.transient();
    auto defaults = immer::vector<SpecDefaultMethod>{}.transient();

    for (const auto& method : spec.methods) {
        if (method.modifiers.is_static) {
            continue;
        }
        if (method.modifiers.is_default) {
            defaults.push_back(SpecDefaultMethod{method.name, method.return_type});
            continue;
        }
        optics.push_back(analyse_method(spec, *source, method));
    }

    analysis.optics = optics.persistent();
    analysis.default_methods = defaults.persistent();

    // ThroughField composes with the spec's own lens for the field
    for (const auto& optic : analysis.optics) {
        auto* through = std::get_if<ThroughFieldHint>(&optic.traversal);
        if (!through) {
            continue;
        }
        const SpecOptic* lens = analysis.find(through->field);
        if (!lens || lens->kind != OpticKind::Lens) {
            throw GenerationError(spec_name, optic.name,
                                  "ThroughField '" + through->field + "' requires a Lens method named '"
                                      + through->field + "' in the same spec");
        }
    }

    detail::log_info("SpecAnalyser", spec_name + ": " + std::to_string(analysis.optics.size()) + " optic(s), "
                                         + std::to_string(analysis.default_methods.size()) + " default method(s)");
    return analysis;
}

SpecOptic SpecAnalyser::analyse_method(const TypeDecl& spec, const TypeRef& source, const MethodDecl& method) const
{
    const auto& spec_name = spec.qualified_name;
    if (!method.params.empty()) {
        throw GenerationError(spec_name, method.name, "optic method '" + method.name + "' must not declare parameters");
    }

    auto kind = optic_family(method.return_type);
    if (!kind) {
        throw GenerationError(spec_name, method.name,
                              "optic method '" + method.name
                                  + "' must return Lens, Prism, Traversal, Affine, Iso, Getter, or Fold");
    }
    if (method.return_type.args.size() != 2) {
        throw GenerationError(spec_name, method.name,
                              "optic method '" + method.name + "' must declare source and focus types");
    }

    SpecOptic optic{method.name, *kind, method.return_type.args[1], NoCopyStrategy{}, NoPrismHint{},
                    NoTraversalHint{}};

    switch (*kind) {
    case OpticKind::Lens: {
        auto copy = read_copy_strategy(method);
        if (!copy) {
            throw GenerationError(spec_name, method.name,
                                  "Lens method '" + method.name
                                      + "' requires a copy strategy annotation: "
                                        "ViaBuilder, Wither, ViaConstructor, or ViaCopyAndSet");
        }
        optic.copy = std::move(*copy);
        break;
    }
    case OpticKind::Prism: {
        auto hint = read_prism_hint(method);
        if (!hint) {
            throw GenerationError(spec_name, method.name,
                                  "Prism method '" + method.name
                                      + "' requires a prism hint annotation: InstanceOf or MatchWhen");
        }
        if (auto* instance_of = std::get_if<InstanceOfHint>(&*hint)) {
            TypeRef target = instance_of->target.value_or(optic.focus);
            if (!types_.is_subtype(target.erasure(), source.erasure())) {
                throw GenerationError(spec_name, method.name,
                                      "InstanceOf target '" + target.to_string()
                                          + "' is not a subtype of source type '" + source.to_string() + "'");
            }
        }
        optic.prism = std::move(*hint);
        break;
    }
    case OpticKind::Traversal:
    case OpticKind::Fold: {
        auto hint = read_traversal_hint(method);
        if (!hint) {
            throw GenerationError(spec_name, method.name,
                                  std::string{to_string(*kind)} + " method '" + method.name
                                      + "' requires a traversal hint annotation: TraverseWith or ThroughField");
        }
        if (auto* through = std::get_if<ThroughFieldHint>(&*hint)) {
            if (through->field.empty()) {
                throw GenerationError(spec_name, method.name, "ThroughField requires a field name");
            }
            if (through->traversal.empty()) {
                through->traversal = detect_traversal(spec, source, method, through->field);
            }
        }
        optic.traversal = std::move(*hint);
        break;
    }
    case OpticKind::Affine:
    case OpticKind::Iso:
    case OpticKind::Getter:
        detail::log_warning("SpecAnalyser", spec_name + "::" + method.name + ": "
                                                + std::string{to_string(*kind)} + " optics are not yet supported");
        break;
    }
    return optic;
}

std::string SpecAnalyser::detect_traversal(const TypeDecl& spec, const TypeRef& source,
                                           const MethodDecl& method, const std::string& field) const
{
    const TypeDecl* source_decl = types_.find(source.name);
    if (!source_decl) {
        throw GenerationError(spec.qualified_name, method.name,
                              "cannot auto-detect traversal: source type '" + source.to_string() + "' is unknown");
    }
    auto type = field_type(*source_decl, field);
    if (!type) {
        throw GenerationError(spec.qualified_name, method.name,
                              "ThroughField references unknown field '" + field + "' of " + source.to_string());
    }
    auto container = classifier_.classify_with_subtypes(*type, types_);
    if (!container) {
        throw GenerationError(spec.qualified_name, method.name,
                              "Cannot auto-detect traversal for field '" + field + "' of type " + type->to_string()
                                  + ". Supported types: List, Set, Optional, Map, arrays."
                                    " Specify the traversal explicitly");
    }
    return std::string{standard_traversal(container->kind)};
}

} // namespace opticsgen
