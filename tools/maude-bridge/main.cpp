// ─────────────────────────────────────────────────────────────────────────────
// maude-bridge - remote side of the bridge backend
// ─────────────────────────────────────────────────────────────────────────────
// Owns one engine process and serves requests from the host over a framed
// JSON connection.
//
// Usage:
//   maude-bridge <session> <cookie> <engine_path> <host:port> [--read-timeout-ms N]
//
// Startup sequence:
//   1. spawn the engine in interactive mode and wait for its first prompt
//   2. dial the host (exponential backoff: 100ms doubling, 2s cap, 5 attempts)
//   3. send hello {session, cookie}
//   4. print READY on stdout
//
// Requests are served one at a time. stdout carries nothing but READY;
// diagnostics go to stderr.

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/write.hpp>
#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "maudepp/backend/backoff_policy.hpp"
#include "maudepp/backend/bridge_protocol.hpp"
#include "maudepp/backend/output_classifier.hpp"
#include "maudepp/backend/pty_wrapper.hpp"
#include "maudepp/log/logger.hpp"
#include "maudepp/log/spdlog_logger.hpp"
#include "maudepp/process/child_process.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace maudepp;
using namespace std::chrono_literals;

namespace {

constexpr auto kStartupTimeout = 10s;
constexpr auto kDefaultReadTimeoutMs = 30000;
constexpr auto kPollInterval = 1s;
constexpr std::size_t kConnectAttempts = 5;
constexpr std::string_view kPrompt = "Maude>";

std::atomic<bool> g_running{true};

void handle_signal(int /*signal*/) {
    g_running = false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Engine Session
// ═══════════════════════════════════════════════════════════════════════════

class EngineSession {
public:
    explicit EngineSession(const std::string& engine_path)
        : process_(make_options(engine_path))
    {}

    ~EngineSession() {
        stop();
    }

    Result<void> start() {
        if (auto spawned = process_.spawn(); !spawned) {
            return spawned;
        }
        owed_prompts_ = 1;
        auto banner = read_until_prompt(kStartupTimeout);
        if (!banner) {
            return tl::unexpected(banner.error());
        }
        return {};
    }

    Result<std::string> request(const std::string& command, std::chrono::milliseconds timeout) {
        std::string line = command;
        if (line.empty() || line.back() != '\n') {
            line += '\n';
        }
        if (auto written = process_.write_all(line); !written) {
            exited_ = true;
            return tl::unexpected(written.error());
        }
        ++owed_prompts_;
        return read_until_prompt(timeout);
    }

    [[nodiscard]] bool exited() const noexcept { return exited_; }

    void stop() {
        if (stopped_) {
            return;
        }
        stopped_ = true;
        // Best effort; the engine may already be gone
        if (process_.write_all("quit\n")) {
            std::this_thread::sleep_for(100ms);
        }
        process_.terminate();
    }

private:
    static ChildProcessOptions make_options(const std::string& engine_path) {
        ChildProcessOptions options;
        options.command = engine_path;
        options.args = {"-interactive"};
        for (auto& arg : engine_base_args()) {
            options.args.push_back(std::move(arg));
        }
        options.stderr_handling = StderrHandling::Merge;
        return options;
    }

    // Every command written owes one prompt. Prompts still owed by commands
    // whose reads timed out close stale output, which is dropped.
    Result<std::string> read_until_prompt(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        while (true) {
            const auto pos = buffer_.find(kPrompt);
            if (pos != std::string::npos) {
                std::string output = buffer_.substr(0, pos);
                buffer_.erase(0, pos + kPrompt.size());
                if (owed_prompts_ > 0) {
                    --owed_prompts_;
                }
                if (owed_prompts_ > 0) {
                    MAUDEPP_LOG_DEBUG("Dropping late engine output (" + std::to_string(output.size()) + " bytes)");
                    continue;
                }
                return output;
            }

            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()
            );
            if (remaining.count() <= 0) {
                return tl::unexpected(Error::timeout(timeout.count()));
            }

            auto chunk = process_.read_some(remaining);
            if (!chunk) {
                return tl::unexpected(chunk.error());
            }
            if (chunk->has_value() == false) {
                exited_ = true;
                const int status = process_.wait();
                return tl::unexpected(Error::crash(status));
            }
            buffer_ += **chunk;
        }
    }

    ChildProcess process_;
    std::string buffer_;
    std::size_t owed_prompts_{0};
    bool exited_{false};
    bool stopped_{false};
};

// ═══════════════════════════════════════════════════════════════════════════
// Host Connection
// ═══════════════════════════════════════════════════════════════════════════

std::optional<asio::ip::tcp::endpoint> parse_endpoint(const std::string& host_port) {
    const auto colon = host_port.rfind(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    asio::error_code ec;
    const auto address = asio::ip::make_address(host_port.substr(0, colon), ec);
    if (ec) {
        return std::nullopt;
    }
    try {
        const auto port = std::stoul(host_port.substr(colon + 1));
        if (port == 0 || port > 65535) {
            return std::nullopt;
        }
        return asio::ip::tcp::endpoint{address, static_cast<unsigned short>(port)};
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool connect_with_retry(asio::ip::tcp::socket& socket, const asio::ip::tcp::endpoint& endpoint) {
    ExponentialBackoff backoff;

    for (std::size_t attempt = 0; attempt < kConnectAttempts; ++attempt) {
        asio::error_code ec;
        socket.connect(endpoint, ec);
        if (!ec) {
            return true;
        }
        socket.close(ec);

        const auto delay = backoff.next_delay(attempt);
        MAUDEPP_LOG_WARN("Connection attempt " + std::to_string(attempt + 1) + "/" +
                         std::to_string(kConnectAttempts) + " failed, retrying in " +
                         std::to_string(delay.count()) + "ms");
        std::this_thread::sleep_for(delay);
    }
    return false;
}

Result<void> send_message(asio::ip::tcp::socket& socket, const Json& message) {
    const auto frame = encode_frame(message);
    asio::error_code ec;
    asio::write(socket, asio::buffer(frame), ec);
    if (ec) {
        return tl::unexpected(Error::protocol_error("send failed: " + ec.message()));
    }
    return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// Request Handling
// ═══════════════════════════════════════════════════════════════════════════

Json handle_request(EngineSession& engine, const Json& request, std::chrono::milliseconds read_timeout) {
    const auto id = message_id(request);
    const auto type = message_type(request);

    if (type.has_value() == false) {
        return make_error(id, "unknown_command");
    }

    switch (*type) {
        case BridgeMessageType::Execute: {
            if (request.contains("text") == false || request.at("text").is_string() == false) {
                return make_error(id, "decode_command_failed");
            }
            auto output = engine.request(request.at("text").get<std::string>(), read_timeout);
            if (!output) {
                MAUDEPP_LOG_WARN("Engine read failed: " + output.error().describe());
                return make_error(id, "read_failed");
            }
            return make_ok(id, *output);
        }

        case BridgeMessageType::LoadFile: {
            if (request.contains("path") == false || request.at("path").is_string() == false) {
                return make_error(id, "decode_path_failed");
            }
            const auto path = request.at("path").get<std::string>();
            auto output = engine.request("load " + path, read_timeout);
            if (!output) {
                MAUDEPP_LOG_WARN("Engine read failed: " + output.error().describe());
                return make_error(id, "load_read_failed");
            }
            if (output->find("Error") != std::string::npos || output->find("Warning") != std::string::npos) {
                return make_error(id, "load_failed", trim(*output));
            }
            return make_ok(id);
        }

        case BridgeMessageType::Ping:
            return make_pong(id);

        case BridgeMessageType::Stop:
            g_running = false;
            return make_ok(id);

        default:
            return make_error(id, "unknown_command");
    }
}

int serve(asio::ip::tcp::socket& socket, EngineSession& engine, std::chrono::milliseconds read_timeout) {
    FrameDecoder decoder;
    std::array<char, 4096> buffer;

    while (g_running) {
        if (ChildProcess::wait_for_readable(socket.native_handle(), kPollInterval) == false) {
            continue;
        }

        asio::error_code ec;
        const auto n = socket.read_some(asio::buffer(buffer), ec);
        if (ec) {
            if (ec != asio::error::eof) {
                MAUDEPP_LOG_ERROR("Connection error: " + ec.message());
            }
            break;
        }
        decoder.append(std::string_view(buffer.data(), n));

        while (true) {
            auto next = decoder.next();
            if (!next) {
                MAUDEPP_LOG_ERROR("Protocol error: " + next.error().message);
                return 1;
            }
            if (next->has_value() == false) {
                break;
            }

            const auto reply = handle_request(engine, **next, read_timeout);
            if (engine.exited()) {
                // No reply: closing the connection reports the crash to the host
                MAUDEPP_LOG_ERROR("Engine exited, closing the connection");
                return 1;
            }
            if (auto sent = send_message(socket, reply); !sent) {
                MAUDEPP_LOG_ERROR(sent.error().message);
                return 1;
            }
            if (g_running == false) {
                break;
            }
        }
    }
    return 0;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("maude-bridge", "Bridge between a maudepp host and one Maude process");

    options.add_options()
        ("session", "Session id assigned by the host", cxxopts::value<std::string>())
        ("cookie", "Shared secret echoed in the handshake", cxxopts::value<std::string>())
        ("engine", "Path to the Maude executable", cxxopts::value<std::string>())
        ("host", "Host endpoint as address:port", cxxopts::value<std::string>())
        ("read-timeout-ms", "Wait for one engine reply before answering read_failed",
            cxxopts::value<int>()->default_value(std::to_string(kDefaultReadTimeoutMs)))
        ("log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>()->default_value("info"))
        ("h,help", "Print usage");

    options.parse_positional({"session", "cookie", "engine", "host"});
    options.positional_help("<session> <cookie> <engine_path> <host:port>");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cerr << options.help() << "\n";
            return 0;
        }

        for (const char* required : {"session", "cookie", "engine", "host"}) {
            if (result.count(required) == 0) {
                std::cerr << "Missing argument: " << required << "\n" << options.help() << "\n";
                return 1;
            }
        }

        set_logger(make_spdlog_stderr_logger(parse_log_level(result["log-level"].as<std::string>())));

        const auto session = result["session"].as<std::string>();
        const auto cookie = result["cookie"].as<std::string>();
        const auto engine_path = result["engine"].as<std::string>();
        const auto host = result["host"].as<std::string>();
        const auto read_timeout = std::chrono::milliseconds(result["read-timeout-ms"].as<int>());
        if (read_timeout.count() <= 0) {
            MAUDEPP_LOG_ERROR("read-timeout-ms must be positive");
            return 1;
        }

        const auto endpoint = parse_endpoint(host);
        if (endpoint.has_value() == false) {
            MAUDEPP_LOG_ERROR("Invalid host endpoint: " + host);
            return 1;
        }

        std::signal(SIGTERM, handle_signal);
        std::signal(SIGINT, handle_signal);

        MAUDEPP_LOG_INFO("Starting engine: " + engine_path);
        EngineSession engine(engine_path);
        if (auto started = engine.start(); !started) {
            MAUDEPP_LOG_ERROR("Engine startup failed: " + started.error().describe());
            return 1;
        }

        asio::io_context io;
        asio::ip::tcp::socket socket(io);
        MAUDEPP_LOG_INFO("Connecting to host: " + host);
        if (connect_with_retry(socket, *endpoint) == false) {
            MAUDEPP_LOG_ERROR("Could not connect to host after " + std::to_string(kConnectAttempts) + " attempts");
            return 1;
        }

        if (auto sent = send_message(socket, make_hello(session, cookie)); !sent) {
            MAUDEPP_LOG_ERROR(sent.error().message);
            return 1;
        }

        std::cout << "READY" << std::endl;
        MAUDEPP_LOG_INFO("Bridge " + session + " ready");

        const int exit_code = serve(socket, engine, read_timeout);

        MAUDEPP_LOG_INFO("Shutting down");
        asio::error_code ec;
        socket.close(ec);
        engine.stop();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        MAUDEPP_LOG_ERROR(std::string("Fatal: ") + e.what());
        return 1;
    }
}
