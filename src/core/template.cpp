/**
 * @file template.cpp
 * @brief Placeholder expansion implementation.
 * @author Dimitris Kafetzis
 */

#include "core/template.hpp"

#include <optional>

namespace agent_orchestrator {

namespace {

/// Single pass over the template; `on_key` maps a key to its replacement.
template <typename OnKey>
Result<std::string> scan(std::string_view tmpl, OnKey&& on_key) {
    std::string out;
    out.reserve(tmpl.size());

    for (size_t i = 0; i < tmpl.size(); ++i) {
        char c = tmpl[i];
        if (c == '{') {
            if (i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
                out.push_back('{');
                ++i;
                continue;
            }
            auto close = tmpl.find('}', i + 1);
            if (close == std::string_view::npos) {
                return Error{ErrorKind::Config,
                             "Unbalanced '{' in template: " + std::string{tmpl}};
            }
            auto key = tmpl.substr(i + 1, close - i - 1);
            auto value = on_key(key);
            if (!value) {
                return Error{ErrorKind::Config, "Unknown template key '" + std::string{key}
                                                    + "' in value: " + std::string{tmpl}};
            }
            out += *value;
            i = close;
        } else if (c == '}') {
            if (i + 1 < tmpl.size() && tmpl[i + 1] == '}') {
                out.push_back('}');
                ++i;
                continue;
            }
            return Error{ErrorKind::Config, "Unbalanced '}' in template: " + std::string{tmpl}};
        } else {
            out.push_back(c);
        }
    }
    return out;
}

}  // namespace

Result<std::string> expand_template(std::string_view tmpl, const TemplateVars& vars) {
    return scan(tmpl, [&](std::string_view key) -> std::optional<std::string> {
        auto it = vars.find(key);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    });
}

Result<void> validate_template(std::string_view tmpl, const TemplateVars& allowed) {
    auto expanded = expand_template(tmpl, allowed);
    if (!expanded) return expanded.error();
    return Result<void>{};
}

}  // namespace agent_orchestrator
