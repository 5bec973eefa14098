#include "maudepp/backend/output_classifier.hpp"

#include <regex>

namespace maudepp {

namespace {

constexpr std::size_t kMaxMessageTerm = 100;

const std::regex& no_module_pattern() {
    static const std::regex pattern{R"(no module\s+(\S+))", std::regex::icase};
    return pattern;
}

const std::regex& module_not_found_pattern() {
    static const std::regex pattern{R"(module\s+(\S+)\s+not found)", std::regex::icase};
    return pattern;
}

const std::regex& syntax_error_pattern() {
    static const std::regex pattern{R"(syntax error)", std::regex::icase};
    return pattern;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

// First line of text, without the leading diagnostic prefix
std::string first_line_after(std::string_view output, std::string_view prefix) {
    auto pos = output.find(prefix);
    if (pos == std::string_view::npos) {
        return trim(output.substr(0, output.find('\n')));
    }
    auto rest = output.substr(pos + prefix.size());
    return trim(rest.substr(0, rest.find('\n')));
}

Error make_output_error(ErrorKind kind, std::string message, std::string_view output) {
    Error error{kind, std::move(message)};
    error.raw_output = std::string(output);
    return error;
}

}  // namespace

std::string trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    const auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(whitespace);
    return std::string(text.substr(begin, end - begin + 1));
}

std::string format_command(std::string_view command) {
    std::string formatted = trim(command);
    if (formatted.empty() || formatted.back() != '.') {
        formatted += " .";
    }
    formatted += '\n';
    return formatted;
}

bool has_engine_error(std::string_view output) {
    if (contains(output, "No parse for term") ||
        contains(output, "Warning:") ||
        contains(output, "Error:") ||
        contains(output, "Advisory:")) {
        return true;
    }
    const std::string text(output);
    return std::regex_search(text, no_module_pattern()) ||
           std::regex_search(text, module_not_found_pattern()) ||
           std::regex_search(text, syntax_error_pattern());
}

Error classify_error(std::string_view output) {
    const std::string text(output);
    std::smatch match;

    if (contains(output, "No parse for term")) {
        auto term = first_line_after(output, "No parse for term");
        if (term.empty() == false && term.front() == ':') {
            term = trim(std::string_view(term).substr(1));
        }
        if (term.size() > kMaxMessageTerm) {
            term = term.substr(0, kMaxMessageTerm);
        }
        return make_output_error(
            ErrorKind::ParseError,
            term.empty() ? "Failed to parse term" : "No parse for term: " + term,
            output
        );
    }

    if (std::regex_search(text, match, module_not_found_pattern()) ||
        std::regex_search(text, match, no_module_pattern())) {
        auto name = match[1].str();
        // Engine quotes module names in diagnostics
        while (name.empty() == false && (name.back() == '.' || name.back() == '\'')) {
            name.pop_back();
        }
        while (name.empty() == false && (name.front() == '`' || name.front() == '\'')) {
            name.erase(0, 1);
        }
        return make_output_error(ErrorKind::ModuleNotFound, "Module not found: " + name, output);
    }

    if (std::regex_search(text, match, syntax_error_pattern())) {
        const auto after = static_cast<std::size_t>(match.position(0) + match.length(0));
        auto detail = first_line_after(std::string_view(text).substr(after), ":");
        return make_output_error(
            ErrorKind::SyntaxError,
            detail.empty() ? "Syntax error" : "Syntax error: " + detail,
            output
        );
    }

    if (contains(output, "ambiguous")) {
        return make_output_error(ErrorKind::AmbiguousTerm, "Ambiguous term", output);
    }

    for (std::string_view prefix : {"Error:", "Warning:", "Advisory:"}) {
        if (contains(output, prefix)) {
            return make_output_error(ErrorKind::Unknown, first_line_after(output, prefix), output);
        }
    }

    auto message = trim(output);
    if (message.size() > 200) {
        message = message.substr(0, 200);
    }
    return make_output_error(ErrorKind::Unknown, std::move(message), output);
}

std::string extract_result(std::string_view output) {
    static const std::regex result_pattern{R"(result\s+[\w\-\[\]\{\}',`]+:\s*)"};

    const std::string text(output);
    std::smatch match;
    if (std::regex_search(text, match, result_pattern)) {
        return trim(std::string_view(text).substr(
            static_cast<std::size_t>(match.position(0) + match.length(0))
        ));
    }
    return trim(output);
}

Result<std::string> classify_response(std::string_view response) {
    const auto text = trim(response);
    if (has_engine_error(text)) {
        return tl::unexpected(classify_error(text));
    }
    return extract_result(text);
}

}  // namespace maudepp
