#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include <csignal>
#include <optional>
#include <string>
#include "kernel/config.hpp"
#include "kernel/kernel.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace {

void print_usage(const char* argv0) {
    fmt::print("Usage: {} [config.json]\n\n", argv0);
    fmt::print("Environment:\n");
    fmt::print("  WARDEN_CONFIG        configuration file (when no argument is given)\n");
    fmt::print("  WARDEN_REDIS_URL     redis://host:port/db or memory://\n");
    fmt::print("  WARDEN_POD_NAME      pod identity recorded with sessions\n");
    fmt::print("  WARDEN_POOL_NAME     pool this pod serves\n");
    fmt::print("  WARDEN_MAX_SESSIONS  session capacity\n");
    fmt::print("  WARDEN_TEMPLATES     extra sandbox templates (JSON)\n");
    fmt::print("  WARDEN_LOG_LEVEL     trace, debug, info, warn, error\n");
    fmt::print("  OPA_URL              enables policy evaluation\n");
}

void print_status_box(const warden::kernel::ServiceConfig& config) {
    auto label = fmt::emphasis::bold | fg(fmt::color::white);
    fmt::print(label, "\n    ┌──────────────── WARDEN ────────────────\n");
    fmt::print("    │  Version   {}\n", fmt::format(fg(fmt::color::green), "v0.1.0"));
    fmt::print("    │  Pod       {}\n", fmt::format(fg(fmt::color::yellow), "{}", config.pod_name));
    fmt::print("    │  Pool      {}\n", fmt::format(fg(fmt::color::yellow), "{}", config.pool_name));
    fmt::print("    │  Store     {}\n", fmt::format(fg(fmt::color::cyan), "{}", config.store_url));
    fmt::print("    │  Sessions  {}\n", config.sessions.max_sessions);
    fmt::print("    │  Policy    {}\n", config.policy_enabled
        ? fmt::format(fg(fmt::color::green), "{}", warden::policy::policy_mode_to_string(config.policy.mode))
        : fmt::format(fg(fmt::color::gray), "disabled"));
    fmt::print(label, "    └────────────────────────────────────────\n\n");
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        print_usage(argv[0]);
        return 0;
    }

    // Peer resets surface as EPIPE from write()
    std::signal(SIGPIPE, SIG_IGN);

    warden::util::init_logger();

    warden::kernel::ServiceConfig config;
    try {
        config = warden::kernel::load_service_config(
            argc > 1 ? std::optional<std::string>(argv[1]) : std::nullopt);
    } catch (const warden::ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    warden::util::set_log_level(warden::util::parse_log_level(config.log_level));

    warden::kernel::Kernel kernel(config);
    if (!kernel.init()) {
        fmt::print(fmt::emphasis::bold | fg(fmt::color::red), "\n    ✗  Failed to initialize kernel\n\n");
        return 1;
    }

    print_status_box(config);

    // Blocks until SIGINT or SIGTERM
    kernel.run();

    fmt::print(fg(fmt::color::yellow), "\n    ⟳  Shut down gracefully\n\n");
    return 0;
}
