// navigator.cpp
// Focus class and navigator composition

#include <opticsgen/navigator.h>
#include <opticsgen/diagnostics.h>
#include <opticsgen/naming.h>
#include <opticsgen/optics_generator.h>

#include <algorithm>
#include <string>
#include <vector>

namespace opticsgen {

// ============================================================
// RecursionGuard
// ============================================================

RecursionGuard::RecursionGuard(std::size_t capacity)
    : capacity_(capacity)
{
    stack_.reserve(capacity);
}

bool RecursionGuard::try_push(const std::string& type_name)
{
    if (stack_.size() >= capacity_) {
        return false;
    }
    stack_.push_back(type_name);
    return true;
}

void RecursionGuard::pop()
{
    if (!stack_.empty()) {
        stack_.pop_back();
    }
}

// ============================================================
// NavigatorComposer
// ============================================================

/// Accessors and navigators collected for one class body.
struct NavigatorComposer::Level {
    const GeneratorOptions& options;
    RecursionGuard& guard;
    const TypeRef& root;
    immer::vector<FocusAccessor>::transient_type accessors = immer::vector<FocusAccessor>{}.transient();
    immer::vector<NavigatorBox>::transient_type navigators = immer::vector<NavigatorBox>{}.transient();
    // Names of the navigators enclosing this body, outermost first
    std::vector<std::string> enclosing = {};
};

NavigatorComposer::NavigatorComposer(const TypeIntrospector& types, const TypeShapeAnalyser& analyser)
    : types_(types)
    , analyser_(analyser)
{
}

std::optional<TypeShape> NavigatorComposer::navigable_target(const FieldDescriptor& field) const
{
    if (!field.declared_type.is_declared()) {
        return std::nullopt;
    }
    const TypeDecl* decl = types_.find(field.declared_type.name);
    if (!decl) {
        return std::nullopt;
    }
    auto shape = analyser_.analyse(*decl);
    if (shape.kind() != ShapeKind::Product) {
        return std::nullopt;
    }
    return shape;
}

std::string NavigatorComposer::navigator_name(const Level& level, const FieldDescriptor& field)
{
    // A nested class may not share the name of a class enclosing it
    std::string name = capitalize(field.name) + "Navigator";
    if (std::find(level.enclosing.begin(), level.enclosing.end(), name) != level.enclosing.end()) {
        name += std::to_string(level.enclosing.size() + 1);
    }
    return name;
}

void NavigatorComposer::add_field(Level& level, const TypeShape& owner, const FieldDescriptor& field,
                                  const Expr& base, int remaining) const
{
    Expr lens = field_lens(owner, field);
    Expr path = base.is<SourceRef>() ? lens : expr::compose(base, lens);

    if (remaining > 0 && level.options.field_selected(field.name)) {
        auto target = navigable_target(field);
        if (target && level.guard.try_push(target->type_name())) {
            NavigatorClass navigator{navigator_name(level, field), level.root, field.declared_type,
                                     PathKind::Focus, path, delegate_operations(PathKind::Focus), {}, {}};

            Level inner{level.options, level.guard, level.root};
            inner.enclosing = level.enclosing;
            inner.enclosing.push_back(navigator.name);
            for (const auto& nested : target->fields()) {
                add_field(inner, *target, nested, path, remaining - 1);
            }
            level.guard.pop();

            navigator.accessors = inner.accessors.persistent();
            navigator.navigators = inner.navigators.persistent();
            level.accessors.push_back(FocusAccessor{field.name, PathKind::Focus, field.declared_type, path,
                                                    navigator.name});
            level.navigators.push_back(NavigatorBox{std::move(navigator)});
            return;
        }
    }

    // Plain accessor, widened by the field's container kind
    PathKind kind = PathKind::Focus;
    TypeRef focus = field.declared_type;
    if (field.container) {
        switch (field.container->kind) {
        case ContainerKind::Optional:
            kind = PathKind::Affine;
            break;
        case ContainerKind::List:
        case ContainerKind::Set:
        case ContainerKind::Array:
            kind = PathKind::Traversal;
            break;
        case ContainerKind::Map:
            break;
        }
        if (kind != PathKind::Focus) {
            path = expr::compose(std::move(path), expr::traversal_ref(standard_traversal(field.container->kind)));
            focus = field.container->element;
        }
    }
    level.accessors.push_back(FocusAccessor{field.name, kind, std::move(focus), std::move(path), std::nullopt});
}

GeneratedClass NavigatorComposer::compose(const TypeShape& root, const GeneratorOptions& options) const
{
    if (root.kind() != ShapeKind::Product) {
        throw GenerationError(root.type_name(), {},
                              "Focus generation requires a record type, got " + std::string{to_string(root.kind())});
    }

    RecursionGuard guard{static_cast<std::size_t>(kMaxNavigatorDepth) + 1};
    (void)guard.try_push(root.type_name());

    const int depth = options.generate_navigators ? options.effective_depth() : 0;

    Level level{options, guard, root.type()};
    // SourceRef marks the root: its field paths are the bare field lenses
    const Expr root_path = expr::source();
    for (const auto& field : root.fields()) {
        add_field(level, root, field, root_path, depth);
    }

    auto members = immer::vector<Member>{}.transient();
    auto navigators = level.navigators.persistent();
    for (const auto& accessor : level.accessors.persistent()) {
        members.push_back(accessor);
    }
    for (const auto& navigator : navigators) {
        members.push_back(navigator.get());
    }

    GeneratedClass generated{options.scope_for(root.scope()), root.simple_name() + "Focus", ClassOrigin::Focus,
                             root.type(), members.persistent()};
    detail::log_info("NavigatorComposer", generated.qualified_name() + ": " + std::to_string(navigators.size())
                                              + " navigator(s) at depth " + std::to_string(depth));
    return generated;
}

} // namespace opticsgen
