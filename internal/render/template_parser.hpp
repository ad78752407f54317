#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/model.hpp"
#include "internal/render/template_ast.hpp"

namespace colguard::render {

// Model-agnostic; the renderer rewraps it as util::TemplateSyntaxError.
class TemplateParseError : public std::runtime_error {
 public:
  explicit TemplateParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Parses template text into a statement tree.

  Supported statements: if / elif / else, for (with inline `if` and
  else), set (assignment and block form) and do. Any other statement
  is a TemplateParseError.

  {# #} comments are dropped, {% raw %} blocks become text, and
  {% macro %}...{% endmacro %} blocks are lifted into Template::macros.
  A leading or trailing '-' inside a delimiter trims adjacent whitespace.
*/
Template ParseTemplate(std::string_view text);

// Body of a single {{ }} directive.
TemplateExprPtr ParseExpression(std::string_view text);

// Every {% macro %} defined in a macro file.
std::vector<model::Macro> ParseMacroFile(std::string_view text, const std::filesystem::path& path);

} // namespace colguard::render
