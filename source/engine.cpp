// engine.cpp
// Request orchestration and once-per-name writes

#include <opticsgen/engine.h>
#include <opticsgen/diagnostics.h>

#include <unordered_set>

namespace opticsgen {

Engine::Engine(const TypeIntrospector& types, CodeSink& sink, ContainerClassifier classifier)
    : types_(types)
    , sink_(sink)
    , analyser_(types, classifier)
    , specs_(types, classifier)
    , generator_(types)
    , navigators_(types, analyser_)
{
}

GeneratedClass Engine::plan(const GenerationRequest& request) const
{
    const TypeDecl* decl = types_.find(request.type_name);
    if (!decl) {
        throw GenerationError(request.type_name, {}, "type is not known to the introspector");
    }

    switch (request.kind) {
    case RequestKind::Optics:
        return generator_.generate(analyser_.analyse(*decl), request.options);
    case RequestKind::Focus:
        return navigators_.compose(analyser_.analyse(*decl), request.options);
    case RequestKind::Spec:
        return generator_.generate_spec(specs_.analyse(*decl), request.options);
    }
    throw GenerationError(request.type_name, {}, "unknown request kind");
}

RunReport Engine::run(const std::vector<GenerationRequest>& requests)
{
    RunReport report;
    std::unordered_set<std::string> written;

    for (const auto& request : requests) {
        try {
            auto generated = plan(request);
            auto name = generated.qualified_name();
            if (!written.insert(name).second) {
                throw GenerationError(request.type_name, {},
                                      "generated class '" + name + "' was already produced in this pass");
            }
            sink_.write(generated);
            report.generated = report.generated.push_back(std::move(name));
        } catch (const GenerationError& e) {
            detail::log_warning("Engine", e.what());
            report.diagnostics = report.diagnostics.push_back(Diagnostic{e.type_name(), e.member(), e.what()});
        }
    }

    detail::log_info("Engine", std::to_string(report.generated.size()) + " class(es) generated, "
                                   + std::to_string(report.diagnostics.size()) + " error(s)");
    return report;
}

} // namespace opticsgen
