#ifndef MAUDEPP_BACKEND_OUTPUT_CLASSIFIER_HPP
#define MAUDEPP_BACKEND_OUTPUT_CLASSIFIER_HPP

#include "maudepp/error.hpp"

#include <string>
#include <string_view>

namespace maudepp {

// ─────────────────────────────────────────────────────────────────────────────
// Output classification
// ─────────────────────────────────────────────────────────────────────────────
// Engine errors arrive as ordinary text in the response. Patterns are tried
// in order; the first match decides the error kind:
//
//   "No parse for term"                    -> ParseError
//   "module X not found" / "no module X"   -> ModuleNotFound
//   "syntax error" (any case)              -> SyntaxError
//   "ambiguous"                            -> AmbiguousTerm
//   "Warning:" / "Error:" / "Advisory:"    -> Unknown

/// Whether the text contains an engine diagnostic
[[nodiscard]] bool has_engine_error(std::string_view output);

/// Error for a response that contains a diagnostic (raw_output carries the text)
[[nodiscard]] Error classify_error(std::string_view output);

/// Value after "result <Sort>:" if present, else the trimmed text
[[nodiscard]] std::string extract_result(std::string_view output);

/// Full classification of one framed response
[[nodiscard]] Result<std::string> classify_response(std::string_view response);

/// Trim, terminate with " ." when missing, append the newline
[[nodiscard]] std::string format_command(std::string_view command);

/// Strip surrounding whitespace (including CR from terminal output)
[[nodiscard]] std::string trim(std::string_view text);

}  // namespace maudepp

#endif  // MAUDEPP_BACKEND_OUTPUT_CLASSIFIER_HPP
