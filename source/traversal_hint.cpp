// traversal_hint.cpp
// Traversal hint resolution

#include <opticsgen/traversal_hint.h>
#include <opticsgen/diagnostics.h>

namespace opticsgen {

Expr resolve_traversal(const TraversalHintInfo& hint, std::string_view owner)
{
    struct Visitor {
        std::string owner;

        Expr operator()(const NoTraversalHint&) const
        {
            throw UnresolvedStrategyError("No traversal hint for " + owner);
        }

        Expr operator()(const TraverseWithHint& h) const
        {
            if (h.reference.empty()) {
                throw GenerationError(owner, {}, "TraverseWith requires a traversal reference");
            }
            return expr::traversal_ref(h.reference);
        }

        Expr operator()(const ThroughFieldHint& h) const
        {
            if (h.traversal.empty()) {
                throw UnresolvedStrategyError("Traversal for field '" + h.field + "' of " + owner
                                              + " was not specified and not auto-detected");
            }
            return expr::compose(expr::optic_ref(owner, h.field), expr::traversal_ref(h.traversal));
        }
    };

    return std::visit(Visitor{std::string{owner}}, hint);
}

} // namespace opticsgen
