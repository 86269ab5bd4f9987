// copy_strategy.cpp
// Copy strategy resolution

#include <opticsgen/copy_strategy.h>
#include <opticsgen/diagnostics.h>
#include <opticsgen/naming.h>

namespace opticsgen {

std::string_view to_string(CopyStrategyKind kind) noexcept
{
    switch (kind) {
    case CopyStrategyKind::None:           return "None";
    case CopyStrategyKind::ViaBuilder:     return "ViaBuilder";
    case CopyStrategyKind::Wither:         return "Wither";
    case CopyStrategyKind::ViaConstructor: return "ViaConstructor";
    case CopyStrategyKind::ViaCopyAndSet:  return "ViaCopyAndSet";
    }
    return "?";
}

std::string getter_override(const CopyStrategyInfo& info)
{
    struct Visitor {
        std::string operator()(const NoCopyStrategy&) const { return {}; }
        std::string operator()(const ViaBuilderStrategy& s) const { return s.getter; }
        std::string operator()(const WitherStrategy& s) const { return s.getter; }
        std::string operator()(const ViaConstructorStrategy&) const { return {}; }
        std::string operator()(const ViaCopyAndSetStrategy&) const { return {}; }
    };

    return std::visit(Visitor{}, info);
}

namespace {

std::string or_default(const std::string& name, std::string_view fallback)
{
    return name.empty() ? std::string{fallback} : name;
}

} // namespace

Expr resolve_getter(std::string_view field, const CopyStrategyInfo& info)
{
    return expr::call(expr::source(), or_default(getter_override(info), field));
}

Expr resolve_setter(std::string_view field, const TypeRef& source_type, const CopyStrategyInfo& info)
{
    struct Visitor {
        std::string_view field;
        const TypeRef& source_type;

        Expr operator()(const NoCopyStrategy&) const
        {
            throw UnresolvedStrategyError("No copy strategy for field '" + std::string{field} + "' of "
                                          + source_type.to_string());
        }

        Expr operator()(const ViaBuilderStrategy& s) const
        {
            auto builder = expr::call(expr::source(), or_default(s.to_builder, kDefaultToBuilder));
            auto assigned = expr::call(std::move(builder), or_default(s.setter, field), {expr::new_value()});
            return expr::call(std::move(assigned), or_default(s.build, kDefaultBuild));
        }

        Expr operator()(const WitherStrategy& s) const
        {
            auto wither = or_default(s.wither, "with" + capitalize(field));
            return expr::call(expr::source(), std::move(wither), {expr::new_value()});
        }

        Expr operator()(const ViaConstructorStrategy& s) const
        {
            if (s.parameter_order.empty()) {
                return expr::unsupported("ViaConstructor for field '" + std::string{field} + "' of "
                                         + source_type.to_string() + " needs a non-empty parameterOrder");
            }
            std::vector<Expr> args;
            args.reserve(s.parameter_order.size());
            for (const auto& param : s.parameter_order) {
                args.push_back(param == field ? expr::new_value() : expr::call(expr::source(), param));
            }
            return expr::construct(source_type, std::move(args));
        }

        Expr operator()(const ViaCopyAndSetStrategy& s) const
        {
            TypeRef copy_type = s.copy_constructor.empty() ? source_type : TypeRef::declared(s.copy_constructor);
            auto setter = or_default(s.setter, "set" + capitalize(field));
            return expr::copy_then_set(std::move(copy_type), expr::source(), std::move(setter), expr::new_value());
        }
    };

    return std::visit(Visitor{field, source_type}, info);
}

Expr resolve_lens(std::string_view field, const TypeRef& source_type, const CopyStrategyInfo& info)
{
    auto setter = resolve_setter(field, source_type, info);
    return expr::lens(resolve_getter(field, info), std::move(setter));
}

} // namespace opticsgen
