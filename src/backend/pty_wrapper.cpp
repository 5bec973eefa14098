#include "maudepp/backend/pty_wrapper.hpp"
#include "maudepp/process/executable_locator.hpp"

namespace maudepp {

namespace {

std::optional<std::string> default_lookup(std::string_view name) {
    if (auto found = find_in_path(name)) {
        return found->string();
    }
    return std::nullopt;
}

// Single-quote for the script -c command line
std::string shell_quote(const std::string& word) {
    if (word.find_first_of(" \t\n'\"\\$`;&|<>()*?[]{}!#~") == std::string::npos && word.empty() == false) {
        return word;
    }
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

}  // namespace

std::vector<std::string> engine_base_args() {
    return {"-no-banner", "-no-wrap", "-no-advise"};
}

LaunchCommand build_launch_command(
    const std::string& engine,
    const std::vector<std::string>& extra_args,
    bool use_pty,
    const HelperLookup& lookup
) {
    std::vector<std::string> engine_args = engine_base_args();
    engine_args.insert(engine_args.end(), extra_args.begin(), extra_args.end());

    const HelperLookup& find = lookup ? lookup : HelperLookup{default_lookup};

    if (use_pty) {
#if defined(__APPLE__)
        if (auto script = find("script")) {
            LaunchCommand cmd{*script, {"-q", "/dev/null", engine}, true};
            cmd.args.insert(cmd.args.end(), engine_args.begin(), engine_args.end());
            return cmd;
        }
#else
        if (auto unbuffer = find("unbuffer")) {
            LaunchCommand cmd{*unbuffer, {engine}, true};
            cmd.args.insert(cmd.args.end(), engine_args.begin(), engine_args.end());
            return cmd;
        }
        if (auto script = find("script")) {
            std::string command_line = shell_quote(engine);
            for (const auto& arg : engine_args) {
                command_line += " " + shell_quote(arg);
            }
            return LaunchCommand{*script, {"-qc", command_line, "/dev/null"}, true};
        }
#endif
    }

    LaunchCommand cmd{engine, {"-interactive"}, false};
    cmd.args.insert(cmd.args.end(), engine_args.begin(), engine_args.end());
    return cmd;
}

}  // namespace maudepp
