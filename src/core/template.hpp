/**
 * @file template.hpp
 * @brief "{key}" placeholder expansion for branches, paths and commands.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <map>
#include <string>
#include <string_view>

namespace agent_orchestrator {

using TemplateVars = std::map<std::string, std::string, std::less<>>;

/**
 * @brief Replace every {key} with vars[key]; "{{" and "}}" are literal braces.
 *
 * An unknown key or an unbalanced brace is a ConfigError.
 */
Result<std::string> expand_template(std::string_view tmpl, const TemplateVars& vars);

/**
 * @brief Check that a template only references keys in `allowed`.
 */
Result<void> validate_template(std::string_view tmpl, const TemplateVars& allowed);

}  // namespace agent_orchestrator
