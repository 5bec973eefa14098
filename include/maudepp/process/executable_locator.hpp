#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace maudepp {

// ─────────────────────────────────────────────────────────────────────────────
// IBinaryLocator - resolves the engine executable
// ─────────────────────────────────────────────────────────────────────────────

struct IBinaryLocator {
    virtual ~IBinaryLocator() = default;

    [[nodiscard]] virtual std::optional<std::filesystem::path> find() const = 0;
};

/// True if path names a regular file with an execute bit set
[[nodiscard]] bool is_executable(const std::filesystem::path& path);

/// Search $PATH for name. Names containing '/' are checked as-is.
[[nodiscard]] std::optional<std::filesystem::path> find_in_path(std::string_view name);

/// Platform identifier used for bundled binaries: linux-x64, linux-arm64, darwin-x64, darwin-arm64
[[nodiscard]] std::string platform_tag();

// ─────────────────────────────────────────────────────────────────────────────
// ExecutableLocator - configured path, then bundled binary, then $PATH
// ─────────────────────────────────────────────────────────────────────────────

class ExecutableLocator final : public IBinaryLocator {
public:
    ExecutableLocator(
        std::string configured_path,
        std::string bundle_dir,
        std::string program_name = "maude"
    );

    [[nodiscard]] std::optional<std::filesystem::path> find() const override;

    /// <bundle_dir>/<program>-<platform>, falling back to <bundle_dir>/<program>
    [[nodiscard]] std::optional<std::filesystem::path> bundled_path() const;

private:
    std::string configured_path_;
    std::string bundle_dir_;
    std::string program_name_;
};

}  // namespace maudepp
