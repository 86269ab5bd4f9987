// diagnostics.cpp

#include <opticsgen/diagnostics.h>

namespace opticsgen {

namespace {

std::string with_context(const std::string& type_name, const std::string& member, const std::string& message)
{
    std::string context = type_name;
    if (!member.empty()) {
        context += "::" + member;
    }
    if (context.empty()) {
        return message;
    }
    return context + ": " + message;
}

} // namespace

GenerationError::GenerationError(std::string type_name, std::string member, const std::string& message)
    : std::runtime_error(with_context(type_name, member, message))
    , type_name_(std::move(type_name))
    , member_(std::move(member))
{
}

} // namespace opticsgen
