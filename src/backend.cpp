#include "maudepp/backend.hpp"

#include <algorithm>
#include <cctype>

namespace maudepp {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                      [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
}

}  // namespace

std::optional<BackendKind> parse_backend_kind(std::string_view name) noexcept {
    if (iequals(name, "stream") || iequals(name, "port")) {
        return BackendKind::Stream;
    }
    if (iequals(name, "bridge") || iequals(name, "cnode")) {
        return BackendKind::Bridge;
    }
    if (iequals(name, "native") || iequals(name, "nif")) {
        return BackendKind::Native;
    }
    return std::nullopt;
}

}  // namespace maudepp
