// code_printer.cpp
// C++ text backend for generation plans

#include <opticsgen/code_printer.h>
#include <opticsgen/diagnostics.h>

#include <sstream>

namespace opticsgen {

namespace {

std::string quoted(const std::string& text)
{
    std::string result = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    result += '"';
    return result;
}

std::string print_args(const ExprList& args)
{
    std::string result;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += print_expr(*args[i]);
    }
    return result;
}

struct ExprPrinter {
    std::string operator()(const SourceRef&) const { return "source"; }
    std::string operator()(const NewValueRef&) const { return "newValue"; }

    std::string operator()(const MethodCall& e) const
    {
        return print_expr(*e.receiver) + "." + e.method + "(" + print_args(e.args) + ")";
    }

    std::string operator()(const ConstructorCall& e) const
    {
        return e.type.to_string() + "{" + print_args(e.args) + "}";
    }

    std::string operator()(const CopyThenSet& e) const
    {
        return "[&] { auto copy = " + e.copy_type.to_string() + "{" + print_expr(*e.original) + "}; copy." + e.setter
               + "(" + print_expr(*e.value) + "); return copy; }()";
    }

    std::string operator()(const InstanceOfTest& e) const
    {
        return "(dynamic_cast<const " + e.type.to_string() + "*>(&" + print_expr(*e.subject) + ") != nullptr)";
    }

    std::string operator()(const Narrow& e) const
    {
        return "static_cast<const " + e.type.to_string() + "&>(" + print_expr(*e.subject) + ")";
    }

    std::string operator()(const ConstantRef& e) const { return e.type.to_string() + "::" + e.constant; }

    std::string operator()(const ConstantEquals& e) const
    {
        return "(" + print_expr(*e.subject) + " == " + e.type.to_string() + "::" + e.constant + ")";
    }

    std::string operator()(const OpticSet& e) const
    {
        return "lager::set(" + print_expr(*e.optic) + ", " + print_expr(*e.target) + ", " + print_expr(*e.value) + ")";
    }

    std::string operator()(const Unsupported& e) const { return "opticsgen::unsupported(" + quoted(e.message) + ")"; }

    std::string operator()(const LensOf& e) const
    {
        return "lager::lenses::getset([](const auto& source) { return " + print_expr(*e.getter)
               + "; }, [](auto source, auto newValue) { return " + print_expr(*e.setter) + "; })";
    }

    std::string operator()(const PrismOf& e) const
    {
        return "opticsgen::prism([](const auto& source) { return " + print_expr(*e.matches)
               + "; }, [](const auto& source) { return " + print_expr(*e.extract)
               + "; }, [](auto newValue) { return " + print_expr(*e.review) + "; })";
    }

    std::string operator()(const TraversalRef& e) const { return e.call ? e.target + "()" : e.target; }

    std::string operator()(const OpticRef& e) const { return e.owner + "::" + e.member + "()"; }

    std::string operator()(const Compose& e) const
    {
        return "zug::comp(" + print_expr(*e.outer) + ", " + print_expr(*e.inner) + ")";
    }
};

// ============================================================
// Class rendering
// ============================================================

class ClassWriter {
public:
    explicit ClassWriter(std::ostringstream& out)
        : out_(out)
    {
    }

    void line(const std::string& text = {})
    {
        if (!text.empty()) {
            out_ << std::string(indent_ * 4, ' ') << text;
        }
        out_ << '\n';
    }

    void open(const std::string& text)
    {
        line(text);
        line("{");
        ++indent_;
    }

    void close(const std::string& suffix = {})
    {
        --indent_;
        line("}" + suffix);
    }

    void member(const OpticMember& m)
    {
        line("/// " + std::string{to_string(m.kind)} + "<" + m.source.to_string() + ", " + m.focus.to_string() + ">");
        open("static auto " + m.name + "()");
        line("return " + print_expr(m.body) + ";");
        close();
    }

    void member(const UpdaterMember& m)
    {
        open("static " + m.source.to_string() + " " + m.name + "(" + m.source.to_string() + " source, "
             + m.value.to_string() + " newValue)");
        line("return " + print_expr(m.body) + ";");
        close();
    }

    void member(const PlaceholderMember& m)
    {
        open("[[noreturn]] static " + m.return_type.to_string() + " " + m.name + "()");
        line("throw std::logic_error(" + quoted(m.message) + ");");
        close();
    }

    void member(const FocusAccessor& m, const std::string& root)
    {
        if (m.navigator) {
            open("static " + *m.navigator + "<" + root + "> " + m.name + "()");
            line("return " + *m.navigator + "<" + root + ">{" + print_expr(m.path) + "};");
        } else {
            open("static auto " + m.name + "()");
            line("return opticsgen::" + std::string{to_string(m.path_kind)} + "<" + root + ", "
                 + m.focus.to_string() + ">{" + print_expr(m.path) + "};");
        }
        close();
    }

    void member(const NavigatorClass& n)
    {
        line("template <typename S>");
        open("struct " + n.name);
        line("opticsgen::" + std::string{to_string(n.path_kind)} + "<S, " + n.target.to_string() + "> delegate;");
        line();
        for (const auto& op : n.operations) {
            line("decltype(auto) " + op + "(auto&&... args) const { return delegate." + op
                 + "(std::forward<decltype(args)>(args)...); }");
        }
        for (const auto& nested : n.navigators) {
            line();
            member(nested.get());
        }
        for (const auto& accessor : n.accessors) {
            line();
            member(accessor, "S");
        }
        close(";");
    }

private:
    std::ostringstream& out_;
    int indent_ = 0;
};

} // namespace

std::string print_expr(const Expr& e)
{
    return std::visit(ExprPrinter{}, e.node);
}

std::string print_class(const GeneratedClass& generated)
{
    std::ostringstream out;
    ClassWriter writer{out};
    const auto root = generated.target.to_string();

    if (!generated.scope.empty()) {
        writer.line("namespace " + generated.scope + " {");
        writer.line();
    }
    writer.open("struct " + generated.name);
    bool first = true;
    for (const auto& m : generated.members) {
        if (!first) {
            writer.line();
        }
        first = false;
        std::visit(
            [&](const auto& member) {
                using M = std::decay_t<decltype(member)>;
                if constexpr (std::is_same_v<M, FocusAccessor>) {
                    writer.member(member, root);
                } else {
                    writer.member(member);
                }
            },
            m);
    }
    writer.close(";");
    if (!generated.scope.empty()) {
        writer.line();
        writer.line("} // namespace " + generated.scope);
    }
    return out.str();
}

void TextCodeSink::write(const GeneratedClass& generated)
{
    auto name = generated.qualified_name();
    if (sources_.find(name)) {
        throw GenerationError(generated.target.name, generated.name,
                              "generated class '" + name + "' was already written");
    }
    sources_ = sources_.set(std::move(name), print_class(generated));
}

const std::string* TextCodeSink::find(std::string_view qualified_name) const
{
    return sources_.find(std::string{qualified_name});
}

} // namespace opticsgen
