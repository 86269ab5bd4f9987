// interpreter.cpp
// Expression evaluation and optic construction over dynamic objects

#include <opticsgen/runtime/interpreter.h>
#include <opticsgen/code_printer.h>
#include <opticsgen/container_classifier.h>
#include <opticsgen/naming.h>

#include <zug/compose.hpp>

#include <array>
#include <deque>
#include <unordered_set>

namespace opticsgen::runtime {

namespace {

std::string method_key(const std::string& type, const std::string& method)
{
    return type + "#" + method;
}

bool truthy(const Object& value)
{
    if (auto* b = value.get_if<bool>()) {
        return *b;
    }
    throw std::runtime_error("[Interpreter] expected a boolean, got " + to_string(value));
}

/// Field named by the part of `method` after `prefix`, if the record has it.
std::optional<std::string> prefixed_field(const Record& r, const std::string& method, std::string_view prefix)
{
    if (method.size() <= prefix.size() || !method.starts_with(prefix)) {
        return std::nullopt;
    }
    auto field = decapitalize(std::string_view{method}.substr(prefix.size()));
    if (!r.fields.find(field)) {
        return std::nullopt;
    }
    return field;
}

ObjectTraversal lens_traversal(ObjectLens lens)
{
    return ObjectTraversal{
        [lens](const Object& whole) { return std::vector<Object>{lager::view(lens, whole)}; },
        [lens](const Object& whole, const std::function<Object(const Object&)>& fn) {
            return lager::over(lens, whole, [&fn](const Object& part) { return fn(part); });
        }};
}

ObjectTraversal prism_traversal(ObjectPrism prism)
{
    return ObjectTraversal{
        [prism](const Object& whole) {
            std::vector<Object> result;
            if (auto part = prism.preview(whole)) {
                result.push_back(std::move(*part));
            }
            return result;
        },
        [prism](const Object& whole, const std::function<Object(const Object&)>& fn) {
            if (auto part = prism.preview(whole)) {
                return prism.review(fn(*part));
            }
            return whole;
        }};
}

ObjectTraversal list_traversal()
{
    return ObjectTraversal{
        [](const Object& whole) {
            std::vector<Object> result;
            if (auto* list = whole.get_if<ObjectList>()) {
                for (const auto& item : *list) {
                    result.push_back(item.get());
                }
            }
            return result;
        },
        [](const Object& whole, const std::function<Object(const Object&)>& fn) {
            auto* list = whole.get_if<ObjectList>();
            if (!list) {
                return whole;
            }
            auto updated = ObjectList{}.transient();
            for (const auto& item : *list) {
                updated.push_back(ObjectBox{fn(item.get())});
            }
            return Object{updated.persistent()};
        }};
}

ObjectTraversal map_values_traversal()
{
    return ObjectTraversal{
        [](const Object& whole) {
            std::vector<Object> result;
            if (auto* map = whole.get_if<ObjectMap>()) {
                for (const auto& [key, value] : *map) {
                    result.push_back(value.get());
                }
            }
            return result;
        },
        [](const Object& whole, const std::function<Object(const Object&)>& fn) {
            auto* map = whole.get_if<ObjectMap>();
            if (!map) {
                return whole;
            }
            auto updated = *map;
            for (const auto& [key, value] : *map) {
                updated = updated.set(key, ObjectBox{fn(value.get())});
            }
            return Object{std::move(updated)};
        }};
}

ObjectTraversal optional_traversal()
{
    return ObjectTraversal{
        [](const Object& whole) {
            return whole.is_null() ? std::vector<Object>{} : std::vector<Object>{whole};
        },
        [](const Object& whole, const std::function<Object(const Object&)>& fn) {
            return whole.is_null() ? whole : fn(whole);
        }};
}

} // namespace

Interpreter::Interpreter(const TypeIntrospector& types)
    : types_(types)
{
}

Interpreter& Interpreter::define_method(const std::string& type, const std::string& method, Method fn)
{
    methods_ = methods_.set(method_key(type, method), std::move(fn));
    return *this;
}

Interpreter& Interpreter::define_traversal(const std::string& reference, ObjectTraversal traversal)
{
    traversals_ = traversals_.set(reference, std::move(traversal));
    return *this;
}

Interpreter& Interpreter::add_class(const GeneratedClass& generated)
{
    const auto owner = generated.qualified_name();
    for (const auto& member : generated.members) {
        if (auto* optic = std::get_if<OpticMember>(&member)) {
            optics_ = optics_.set(method_key(owner, optic->name), *optic);
        }
    }
    return *this;
}

const OpticMember& Interpreter::optic(const std::string& owner, const std::string& member) const
{
    if (auto* found = optics_.find(method_key(owner, member))) {
        return *found;
    }
    throw std::invalid_argument("[Interpreter] unknown optic " + owner + "::" + member);
}

// ============================================================
// Method dispatch
// ============================================================

const Method* Interpreter::find_method(const std::string& type, const std::string& method) const
{
    std::unordered_set<std::string> visited;
    std::deque<std::string> pending{type};
    while (!pending.empty()) {
        auto current = std::move(pending.front());
        pending.pop_front();
        if (!visited.insert(current).second) {
            continue;
        }
        if (auto* fn = methods_.find(method_key(current, method))) {
            return fn;
        }
        if (const TypeDecl* decl = types_.find(current)) {
            for (const auto& parent : decl->supertypes) {
                pending.push_back(parent.name);
            }
        }
    }
    return nullptr;
}

Object Interpreter::dispatch(const Object& receiver, const std::string& method, const std::vector<Object>& args) const
{
    if (auto type = receiver.type_name(); !type.empty()) {
        if (const Method* fn = find_method(type, method)) {
            return (*fn)(receiver, args);
        }
    }

    if (auto* r = receiver.get_if<Record>()) {
        if (args.empty()) {
            if (method == "toBuilder" && !r->builder) {
                Record builder = *r;
                builder.builder = true;
                return Object{std::move(builder)};
            }
            if (method == "build" && r->builder) {
                Record built = *r;
                built.builder = false;
                return Object{std::move(built)};
            }
            if (auto* value = r->fields.find(method)) {
                return value->get();
            }
            for (auto prefix : {std::string_view{"get"}, std::string_view{"is"}}) {
                if (auto field = prefixed_field(*r, method, prefix)) {
                    return r->fields.find(*field)->get();
                }
            }
        } else if (args.size() == 1) {
            if (r->builder && r->fields.find(method)) {
                return receiver.with_field(method, args.front());
            }
            for (auto prefix : {std::string_view{"with"}, std::string_view{"set"}}) {
                if (auto field = prefixed_field(*r, method, prefix)) {
                    return receiver.with_field(*field, args.front());
                }
            }
        }
    }

    throw std::runtime_error("[Interpreter] no method '" + method + "' with " + std::to_string(args.size())
                             + " argument(s) on " + to_string(receiver));
}

Object Interpreter::construct(const TypeRef& type, const std::vector<Object>& args) const
{
    const TypeDecl* decl = types_.find(type.name);
    if (!decl || decl->kind != DeclKind::Record) {
        throw std::runtime_error("[Interpreter] no positional constructor for " + type.to_string());
    }
    if (decl->components.size() != args.size()) {
        throw std::runtime_error("[Interpreter] " + type.to_string() + " takes " + std::to_string(decl->components.size())
                                 + " argument(s), got " + std::to_string(args.size()));
    }
    auto fields = ObjectMap{}.transient();
    for (std::size_t i = 0; i < args.size(); ++i) {
        fields.set(decl->components[i].name, ObjectBox{args[i]});
    }
    return Object{Record{type.name, fields.persistent(), false}};
}

Object Interpreter::copy_as(const TypeRef& type, const Object& original) const
{
    if (original.type_name() == type.name) {
        return original;
    }
    const auto* record = original.get_if<Record>();
    if (!record || !types_.find(type.name)) {
        throw std::runtime_error("[Interpreter] no copy constructor " + type.to_string() + "(" + to_string(original)
                                 + ")");
    }
    return Object{Record{type.name, record->fields, false}};
}

bool Interpreter::instance_of(const Object& value, const TypeRef& type) const
{
    auto name = value.type_name();
    return !name.empty() && types_.is_subtype(TypeRef::declared(name), type.erasure());
}

// ============================================================
// Evaluation
// ============================================================

Object Interpreter::evaluate(const Expr& e, const Env& env) const
{
    return std::visit(
        [&](const auto& node) -> Object {
            using N = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<N, SourceRef>) {
                return env.source;
            } else if constexpr (std::is_same_v<N, NewValueRef>) {
                return env.new_value;
            } else if constexpr (std::is_same_v<N, MethodCall>) {
                auto receiver = evaluate(*node.receiver, env);
                std::vector<Object> args;
                for (const auto& arg : node.args) {
                    args.push_back(evaluate(*arg, env));
                }
                return dispatch(receiver, node.method, args);
            } else if constexpr (std::is_same_v<N, ConstructorCall>) {
                std::vector<Object> args;
                for (const auto& arg : node.args) {
                    args.push_back(evaluate(*arg, env));
                }
                return construct(node.type, args);
            } else if constexpr (std::is_same_v<N, CopyThenSet>) {
                auto copy = copy_as(node.copy_type, evaluate(*node.original, env));
                return dispatch(copy, node.setter, {evaluate(*node.value, env)});
            } else if constexpr (std::is_same_v<N, InstanceOfTest>) {
                return Object{instance_of(evaluate(*node.subject, env), node.type)};
            } else if constexpr (std::is_same_v<N, Narrow>) {
                auto subject = evaluate(*node.subject, env);
                if (!instance_of(subject, node.type)) {
                    throw std::runtime_error("[Interpreter] " + to_string(subject) + " is not a "
                                             + node.type.to_string());
                }
                return subject;
            } else if constexpr (std::is_same_v<N, ConstantRef>) {
                return Object::enumeration(node.type.name, node.constant);
            } else if constexpr (std::is_same_v<N, ConstantEquals>) {
                return Object{evaluate(*node.subject, env) == Object::enumeration(node.type.name, node.constant)};
            } else if constexpr (std::is_same_v<N, OpticSet>) {
                return lager::set(lens(*node.optic), evaluate(*node.target, env), evaluate(*node.value, env));
            } else if constexpr (std::is_same_v<N, Unsupported>) {
                throw UnsupportedOperation(node.message);
            } else {
                throw std::logic_error("[Interpreter] optic expression used as a value: " + print_expr(e));
            }
        },
        e.node);
}

// ============================================================
// Optics
// ============================================================

ObjectLens Interpreter::lens(const Expr& e) const
{
    if (auto* l = e.get_if<LensOf>()) {
        Expr getter = l->getter.get();
        Expr setter = l->setter.get();
        return lager::lenses::getset(
            [this, getter](const Object& whole) -> Object { return evaluate(getter, Env{whole, {}}); },
            [this, setter](Object whole, Object part) -> Object {
                return evaluate(setter, Env{std::move(whole), std::move(part)});
            });
    }
    if (auto* ref = e.get_if<OpticRef>()) {
        const auto& member = optic(ref->owner, ref->member);
        if (member.kind != OpticKind::Lens) {
            throw std::invalid_argument("[Interpreter] " + ref->owner + "::" + ref->member + " is not a lens");
        }
        return lens(member.body);
    }
    if (auto* c = e.get_if<Compose>()) {
        return zug::comp(lens(c->outer.get()), lens(c->inner.get()));
    }
    if (auto* u = e.get_if<Unsupported>()) {
        throw UnsupportedOperation(u->message);
    }
    throw std::invalid_argument("[Interpreter] expression does not denote a lens");
}

ObjectLens Interpreter::lens(const std::string& owner, const std::string& member) const
{
    return lens(Expr{OpticRef{owner, member}});
}

ObjectPrism Interpreter::prism(const Expr& e) const
{
    if (auto* p = e.get_if<PrismOf>()) {
        Expr matches = p->matches.get();
        Expr extract = p->extract.get();
        Expr review = p->review.get();
        return ObjectPrism{
            [this, matches, extract](const Object& whole) -> std::optional<Object> {
                if (truthy(evaluate(matches, Env{whole, {}}))) {
                    return evaluate(extract, Env{whole, {}});
                }
                return std::nullopt;
            },
            [this, review](const Object& part) { return evaluate(review, Env{{}, part}); }};
    }
    if (auto* ref = e.get_if<OpticRef>()) {
        const auto& member = optic(ref->owner, ref->member);
        if (member.kind != OpticKind::Prism) {
            throw std::invalid_argument("[Interpreter] " + ref->owner + "::" + ref->member + " is not a prism");
        }
        return prism(member.body);
    }
    if (auto* u = e.get_if<Unsupported>()) {
        throw UnsupportedOperation(u->message);
    }
    throw std::invalid_argument("[Interpreter] expression does not denote a prism");
}

ObjectTraversal Interpreter::standard_traversal(const TraversalRef& ref) const
{
    if (auto* custom = traversals_.find(ref.target)) {
        return *custom;
    }
    if (ref.call) {
        const auto reference = ref.target + "()";
        for (auto kind : {ContainerKind::List, ContainerKind::Set, ContainerKind::Array}) {
            if (reference == opticsgen::standard_traversal(kind)) {
                return list_traversal();
            }
        }
        if (reference == opticsgen::standard_traversal(ContainerKind::Map)) {
            return map_values_traversal();
        }
        if (reference == opticsgen::standard_traversal(ContainerKind::Optional)) {
            return optional_traversal();
        }
    }
    throw std::invalid_argument("[Interpreter] unknown traversal reference '" + ref.target + "'");
}

ObjectTraversal Interpreter::traversal(const Expr& e) const
{
    if (auto* ref = e.get_if<TraversalRef>()) {
        return standard_traversal(*ref);
    }
    if (e.is<LensOf>()) {
        return lens_traversal(lens(e));
    }
    if (e.is<PrismOf>()) {
        return prism_traversal(prism(e));
    }
    if (auto* ref = e.get_if<OpticRef>()) {
        const auto& member = optic(ref->owner, ref->member);
        switch (member.kind) {
        case OpticKind::Lens:
            return lens_traversal(lens(member.body));
        case OpticKind::Prism:
            return prism_traversal(prism(member.body));
        case OpticKind::Traversal:
        case OpticKind::Fold:
            return traversal(member.body);
        case OpticKind::Affine:
        case OpticKind::Iso:
        case OpticKind::Getter:
            break;
        }
        throw std::invalid_argument("[Interpreter] " + ref->owner + "::" + ref->member + " is not traversable");
    }
    if (auto* c = e.get_if<Compose>()) {
        auto outer = traversal(c->outer.get());
        auto inner = traversal(c->inner.get());
        return ObjectTraversal{
            [outer, inner](const Object& whole) {
                std::vector<Object> result;
                for (const auto& part : outer.get_all(whole)) {
                    for (auto& focus : inner.get_all(part)) {
                        result.push_back(std::move(focus));
                    }
                }
                return result;
            },
            [outer, inner](const Object& whole, const std::function<Object(const Object&)>& fn) {
                return outer.modify(whole, [&](const Object& part) { return inner.modify(part, fn); });
            }};
    }
    if (auto* u = e.get_if<Unsupported>()) {
        throw UnsupportedOperation(u->message);
    }
    throw std::invalid_argument("[Interpreter] expression does not denote a traversal");
}

Object Interpreter::update(const UpdaterMember& updater, Object source, Object value) const
{
    return evaluate(updater.body, Env{std::move(source), std::move(value)});
}

} // namespace opticsgen::runtime
