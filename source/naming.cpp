// naming.cpp
// Identifier case conversion and qualified-name splitting

#include <opticsgen/naming.h>

#include <cctype>

namespace opticsgen {

std::string capitalize(std::string_view name)
{
    std::string result{name};
    if (!result.empty()) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

std::string decapitalize(std::string_view name)
{
    std::string result{name};
    if (!result.empty()) {
        result[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(result[0])));
    }
    return result;
}

std::string constant_to_camel(std::string_view constant)
{
    std::string result;
    result.reserve(constant.size());
    bool upper_next = false;
    for (char c : constant) {
        if (c == '_') {
            upper_next = !result.empty();
            continue;
        }
        auto uc = static_cast<unsigned char>(c);
        if (upper_next) {
            result += static_cast<char>(std::toupper(uc));
            upper_next = false;
        } else {
            result += static_cast<char>(std::tolower(uc));
        }
    }
    return result;
}

std::string simple_name_of(std::string_view qualified_name)
{
    auto pos = qualified_name.rfind(kScopeSeparator);
    if (pos == std::string_view::npos) {
        return std::string{qualified_name};
    }
    return std::string{qualified_name.substr(pos + kScopeSeparator.size())};
}

std::string scope_of(std::string_view qualified_name)
{
    auto pos = qualified_name.rfind(kScopeSeparator);
    if (pos == std::string_view::npos) {
        return {};
    }
    return std::string{qualified_name.substr(0, pos)};
}

std::string qualify(std::string_view scope, std::string_view simple_name)
{
    if (scope.empty()) {
        return std::string{simple_name};
    }
    std::string result{scope};
    result += kScopeSeparator;
    result += simple_name;
    return result;
}

} // namespace opticsgen
