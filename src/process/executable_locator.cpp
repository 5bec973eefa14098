#include "maudepp/process/executable_locator.hpp"
#include "maudepp/log/logger.hpp"

#include <cstdlib>
#include <system_error>

#include <sys/utsname.h>
#include <unistd.h>

namespace maudepp {

namespace fs = std::filesystem;

bool is_executable(const fs::path& path) {
    std::error_code ec;
    if (fs::is_regular_file(path, ec) == false) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::optional<fs::path> find_in_path(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string_view::npos) {
        fs::path candidate{std::string(name)};
        if (is_executable(candidate)) {
            return candidate;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }

    std::string_view dirs{path_env};
    while (dirs.empty() == false) {
        const auto sep = dirs.find(':');
        const auto dir = dirs.substr(0, sep);
        if (dir.empty() == false) {
            fs::path candidate = fs::path(std::string(dir)) / std::string(name);
            if (is_executable(candidate)) {
                return candidate;
            }
        }
        if (sep == std::string_view::npos) {
            break;
        }
        dirs.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

std::string platform_tag() {
    struct utsname info{};
    if (uname(&info) != 0) {
        return "unknown";
    }

    const std::string machine = info.machine;
    const bool arm = (machine == "aarch64" || machine == "arm64" || machine.rfind("arm", 0) == 0);

#if defined(__APPLE__)
    return arm ? "darwin-arm64" : "darwin-x64";
#elif defined(__linux__)
    if (arm) {
        return "linux-arm64";
    }
    if (machine == "x86_64" || machine == "amd64") {
        return "linux-x64";
    }
    return "linux-" + machine;
#else
    return std::string(info.sysname) + "-" + machine;
#endif
}

ExecutableLocator::ExecutableLocator(
    std::string configured_path,
    std::string bundle_dir,
    std::string program_name
)
    : configured_path_(std::move(configured_path))
    , bundle_dir_(std::move(bundle_dir))
    , program_name_(std::move(program_name))
{}

std::optional<fs::path> ExecutableLocator::bundled_path() const {
    if (bundle_dir_.empty()) {
        return std::nullopt;
    }
    const fs::path dir{bundle_dir_};

    const auto platform_binary = dir / (program_name_ + "-" + platform_tag());
    if (is_executable(platform_binary)) {
        return platform_binary;
    }
    const auto generic_binary = dir / program_name_;
    if (is_executable(generic_binary)) {
        return generic_binary;
    }
    return std::nullopt;
}

std::optional<fs::path> ExecutableLocator::find() const {
    if (configured_path_.empty() == false) {
        if (auto found = find_in_path(configured_path_)) {
            return found;
        }
        MAUDEPP_LOG_WARN("Configured engine path is not executable: " + configured_path_);
    }

    if (auto bundled = bundled_path()) {
        return bundled;
    }

    return find_in_path(program_name_);
}

}  // namespace maudepp
