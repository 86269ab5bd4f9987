// expr.cpp
// Expression tree builders

#include <opticsgen/expr.h>

namespace opticsgen {

bool Expr::is_optic() const noexcept
{
    return is<LensOf>() || is<PrismOf>() || is<TraversalRef>() || is<OpticRef>() || is<Compose>();
}

namespace expr {

namespace {

ExprBox boxed(Expr e)
{
    return ExprBox{std::move(e)};
}

ExprList boxed_list(std::vector<Expr> exprs)
{
    auto list = ExprList{}.transient();
    for (auto& e : exprs) {
        list.push_back(boxed(std::move(e)));
    }
    return list.persistent();
}

} // namespace

Expr source()
{
    return Expr{SourceRef{}};
}

Expr new_value()
{
    return Expr{NewValueRef{}};
}

Expr call(Expr receiver, std::string method, std::vector<Expr> args)
{
    return Expr{MethodCall{boxed(std::move(receiver)), std::move(method), boxed_list(std::move(args))}};
}

Expr construct(TypeRef type, std::vector<Expr> args)
{
    return Expr{ConstructorCall{std::move(type), boxed_list(std::move(args))}};
}

Expr copy_then_set(TypeRef copy_type, Expr original, std::string setter, Expr value)
{
    return Expr{CopyThenSet{std::move(copy_type), boxed(std::move(original)), std::move(setter),
                            boxed(std::move(value))}};
}

Expr instance_of(Expr subject, TypeRef type)
{
    return Expr{InstanceOfTest{boxed(std::move(subject)), std::move(type)}};
}

Expr narrow(Expr subject, TypeRef type)
{
    return Expr{Narrow{boxed(std::move(subject)), std::move(type)}};
}

Expr constant(TypeRef type, std::string constant)
{
    return Expr{ConstantRef{std::move(type), std::move(constant)}};
}

Expr constant_equals(Expr subject, TypeRef type, std::string constant)
{
    return Expr{ConstantEquals{boxed(std::move(subject)), std::move(type), std::move(constant)}};
}

Expr optic_set(Expr optic, Expr target, Expr value)
{
    return Expr{OpticSet{boxed(std::move(optic)), boxed(std::move(target)), boxed(std::move(value))}};
}

Expr unsupported(std::string message)
{
    return Expr{Unsupported{std::move(message)}};
}

Expr lens(Expr getter, Expr setter)
{
    return Expr{LensOf{boxed(std::move(getter)), boxed(std::move(setter))}};
}

Expr prism(Expr matches, Expr extract, Expr review)
{
    return Expr{PrismOf{boxed(std::move(matches)), boxed(std::move(extract)), boxed(std::move(review))}};
}

Expr traversal_ref(std::string_view reference)
{
    constexpr std::string_view call_suffix = "()";
    if (reference.ends_with(call_suffix)) {
        reference.remove_suffix(call_suffix.size());
        return Expr{TraversalRef{std::string{reference}, true}};
    }
    return Expr{TraversalRef{std::string{reference}, false}};
}

Expr optic_ref(std::string owner, std::string member)
{
    return Expr{OpticRef{std::move(owner), std::move(member)}};
}

Expr compose(Expr outer, Expr inner)
{
    return Expr{Compose{boxed(std::move(outer)), boxed(std::move(inner))}};
}

} // namespace expr

} // namespace opticsgen
