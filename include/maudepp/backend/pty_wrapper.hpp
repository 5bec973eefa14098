#ifndef MAUDEPP_BACKEND_PTY_WRAPPER_HPP
#define MAUDEPP_BACKEND_PTY_WRAPPER_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace maudepp {

// ─────────────────────────────────────────────────────────────────────────────
// PTY wrapper selection
// ─────────────────────────────────────────────────────────────────────────────
// The engine prints prompts only when it believes it talks to a terminal.
// A helper allocates a pseudo-terminal around it:
//
//   Linux:  unbuffer <engine> <args...>
//           script -qc "<engine> <args...>" /dev/null
//   macOS:  script -q /dev/null <engine> <args...>
//
// Without a helper (or with use_pty off) the engine runs directly and
// -interactive is prepended so it still prints prompts.

struct LaunchCommand {
    std::string program;
    std::vector<std::string> args;
    bool uses_pty{false};
};

/// Looks up a helper by name (defaults to a $PATH search)
using HelperLookup = std::function<std::optional<std::string>(std::string_view)>;

/// Flags that suppress the banner, line wrapping and advisories
[[nodiscard]] std::vector<std::string> engine_base_args();

[[nodiscard]] LaunchCommand build_launch_command(
    const std::string& engine,
    const std::vector<std::string>& extra_args,
    bool use_pty,
    const HelperLookup& lookup = {}
);

}  // namespace maudepp

#endif  // MAUDEPP_BACKEND_PTY_WRAPPER_HPP
