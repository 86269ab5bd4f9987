// prism_hint.cpp
// Prism hint resolution

#include <opticsgen/prism_hint.h>
#include <opticsgen/diagnostics.h>

namespace opticsgen {

PrismHintResolver::PrismHintResolver(const TypeIntrospector& types)
    : types_(types)
{
}

Expr PrismHintResolver::resolve(const PrismHintInfo& hint, const TypeRef& sum_type, const TypeRef& focus_type) const
{
    struct Visitor {
        const TypeIntrospector& types;
        const TypeRef& sum_type;
        const TypeRef& focus_type;

        Expr operator()(const NoPrismHint&) const
        {
            throw UnresolvedStrategyError("No prism hint for " + sum_type.to_string() + " -> "
                                          + focus_type.to_string());
        }

        Expr operator()(const InstanceOfHint& h) const
        {
            TypeRef target = h.target.value_or(focus_type);
            if (!types.is_subtype(target.erasure(), sum_type.erasure())) {
                throw GenerationError(sum_type.name, {},
                                      "InstanceOf target '" + target.to_string()
                                          + "' is not a subtype of source type '" + sum_type.to_string() + "'");
            }
            return expr::prism(expr::instance_of(expr::source(), target),
                               expr::narrow(expr::source(), target),
                               expr::new_value());
        }

        Expr operator()(const MatchWhenHint& h) const
        {
            if (h.predicate.empty() || h.getter.empty()) {
                throw GenerationError(sum_type.name, {}, "MatchWhen requires both a predicate and a getter method");
            }
            return expr::prism(expr::call(expr::source(), h.predicate),
                               expr::call(expr::source(), h.getter),
                               expr::new_value());
        }
    };

    return std::visit(Visitor{types_, sum_type, focus_type}, hint);
}

} // namespace opticsgen
