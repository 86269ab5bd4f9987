// options.cpp
// Generator option parsing

#include <opticsgen/options.h>
#include <opticsgen/diagnostics.h>

#include <algorithm>
#include <charconv>

namespace opticsgen {

bool GeneratorOptions::field_selected(const std::string& field) const
{
    if (exclude_fields.count(field) > 0) {
        return false;
    }
    return include_fields.empty() || include_fields.count(field) > 0;
}

int GeneratorOptions::effective_depth() const noexcept
{
    return std::clamp(max_navigator_depth, 1, kMaxNavigatorDepth);
}

std::string GeneratorOptions::scope_for(const std::string& declaring_scope) const
{
    return target_package.empty() ? declaring_scope : target_package;
}

namespace {

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

immer::set<std::string> parse_list(std::string_view value)
{
    auto result = immer::set<std::string>{};
    while (!value.empty()) {
        auto comma = value.find(',');
        auto item = trim(value.substr(0, comma));
        if (!item.empty()) {
            result = result.insert(std::string{item});
        }
        if (comma == std::string_view::npos) {
            break;
        }
        value.remove_prefix(comma + 1);
    }
    return result;
}

bool parse_bool(std::string_view key, std::string_view value)
{
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw ConfigError("Option '" + std::string{key} + "' expects true or false, got '" + std::string{value} + "'");
}

int parse_depth(std::string_view key, std::string_view value)
{
    int depth = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), depth);
    if (ec != std::errc{} || end != value.data() + value.size()) {
        throw ConfigError("Option '" + std::string{key} + "' expects an integer, got '" + std::string{value} + "'");
    }
    if (depth <= 0) {
        throw ConfigError("Option '" + std::string{key} + "' must be positive, got " + std::to_string(depth));
    }
    if (depth > kMaxNavigatorDepth) {
        detail::log_warning("GeneratorOptions", "navigator depth " + std::to_string(depth) + " clamped to "
                                                    + std::to_string(kMaxNavigatorDepth));
        depth = kMaxNavigatorDepth;
    }
    return depth;
}

} // namespace

GeneratorOptions parse_options(const std::vector<std::string>& args)
{
    GeneratorOptions options;
    for (const auto& arg : args) {
        std::string_view view{arg};
        auto eq = view.find('=');
        if (!view.starts_with(kOptionPrefix) || eq == std::string_view::npos) {
            throw ConfigError("Malformed option '" + arg + "', expected opticsgen.<key>=<value>");
        }
        auto key = trim(view.substr(kOptionPrefix.size(), eq - kOptionPrefix.size()));
        auto value = trim(view.substr(eq + 1));

        if (key == "maxNavigatorDepth") {
            options.max_navigator_depth = parse_depth(key, value);
        } else if (key == "includeFields") {
            options.include_fields = parse_list(value);
        } else if (key == "excludeFields") {
            options.exclude_fields = parse_list(value);
        } else if (key == "allowMutable") {
            options.allow_mutable_fields = parse_bool(key, value);
        } else if (key == "targetPackage") {
            options.target_package = std::string{value};
        } else if (key == "generateNavigators") {
            options.generate_navigators = parse_bool(key, value);
        } else {
            throw ConfigError("Unknown option '" + std::string{key} + "'");
        }
    }
    return options;
}

} // namespace opticsgen
