#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "managers/instance_lock.hpp"
#include "platform/platform.hpp"
#include "platform/process.hpp"
#include "tls/client_factory.hpp"

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

static void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::usage("mcpcore-server", "[--config <path>] [--no-kill-existing]",
                              "Take the instance lock and run");
    std::cout << theme::usage("mcpcore-server fetch", "--cert <pem> <url>",
                              "GET a URL from a pinned server");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    mcpcore-server --version    Show version\n"
              << "    mcpcore-server --help       Show this help"
              << theme::color::RESET << "\n\n";
}

static int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LockIO:           return EXIT_LOCK_IO;
        case ErrorKind::LockContention:
        case ErrorKind::KillFailure:      return EXIT_LOCK_CONTENTION;
        case ErrorKind::CertificateParse:
        case ErrorKind::Config:           return EXIT_TLS_CONFIG;
        case ErrorKind::Verification:
        case ErrorKind::Transport:        return EXIT_TRANSPORT;
        default:                          return EXIT_STARTUP_FAILURE;
    }
}

static Result<Config> load_config(const std::string& config_path) {
    if (!config_path.empty()) {
        return Config::load_file(config_path);
    }
    if (!config_exists()) {
        auto created = create_default_config();
        if (created.is_err()) {
            log_warn("main", "could not write default config: " + created.error);
        }
    }
    return Config::load();
}

static int run_server(const Config& config, bool kill_existing) {
    platform::SystemProcessControl processes;
    InstanceLock lock(LockOptions::from_config(config), processes);

    auto acquired = lock.acquire(kill_existing);
    if (acquired.is_err()) {
        std::cout << theme::fail(acquired.error);
        log_error("main", fmt::format("lock {} failed ({}): {}", lock.path().string(),
                                      error_kind_name(acquired.kind), acquired.error));
        return exit_code_for(acquired.kind);
    }
    if (acquired.value == LockStatus::Rejected) {
        std::cout << theme::warn("Another instance is already running.");
        std::cout << theme::step("Lock file: " + lock.path().string());
        return EXIT_ALREADY_RUNNING;
    }

    LockGuard guard(lock);
    std::cout << theme::banner();
    std::cout << theme::kv("pid", std::to_string(lock.pid()));
    std::cout << theme::kv("lock", lock.path().string());
    std::cout << theme::kv("log", debug_log_path());
    std::cout << theme::ok("Running. Press Ctrl-C to stop.");
    log_info("main", fmt::format("instance {} running", lock.pid()));

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!g_stop) {
        platform::sleep_ms(200);
    }

    log_info("main", "shutdown requested");
    std::cout << "\n" << theme::info("Shutting down.");
    return 0;
}

static int run_fetch(const Config& config, const std::vector<std::string>& args) {
    std::string cert_path;
    std::string url;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--cert" && i + 1 < args.size()) {
            cert_path = args[++i];
        } else if (url.empty()) {
            url = args[i];
        } else {
            std::cout << theme::fail("Unexpected argument: " + args[i]);
            return EXIT_STARTUP_FAILURE;
        }
    }
    if (cert_path.empty() || url.empty()) {
        std::cout << theme::fail("Missing certificate or URL.");
        std::cout << theme::step("Usage: mcpcore-server fetch --cert <pem> <url>");
        return EXIT_STARTUP_FAILURE;
    }

    std::ifstream in(cert_path, std::ios::binary);
    if (!in) {
        std::cout << theme::fail("Cannot read certificate file: " + cert_path);
        return EXIT_TLS_CONFIG;
    }
    std::string pem((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    HttpClientFactory factory(config.tls());
    auto client = factory.new_client_for_self_signed_server(pem);
    if (client.is_err()) {
        std::cout << theme::fail(client.error);
        return exit_code_for(client.kind);
    }

    HttpRequest request;
    request.url = url;
    auto response = client.value->send(request);
    if (response.is_err()) {
        std::cout << theme::fail(response.error);
        return exit_code_for(response.kind);
    }

    std::cout << theme::kv("status", fmt::format("{} {}", response.value.status, response.value.reason));
    std::cout << response.value.body;
    if (!response.value.body.empty() && response.value.body.back() != '\n') std::cout << "\n";
    return 0;
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        std::string config_path;
        bool kill_existing = true;
        bool fetch = false;
        std::vector<std::string> rest;

        for (size_t i = 0; i < args.size(); i++) {
            const std::string& arg = args[i];
            if (arg == "--version") {
                std::cout << theme::color::AMBER << theme::color::BOLD << "mcpcore-server"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << MCPCORE_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help") {
                print_usage();
                return 0;
            } else if (arg == "--config") {
                if (i + 1 >= args.size()) {
                    std::cout << theme::fail("--config needs a path.");
                    return EXIT_STARTUP_FAILURE;
                }
                config_path = args[++i];
            } else if (arg == "--no-kill-existing") {
                kill_existing = false;
            } else if (arg == "fetch" && !fetch && rest.empty()) {
                fetch = true;
            } else if (fetch) {
                rest.push_back(arg);
            } else {
                std::cout << theme::fail("Unknown argument: " + arg);
                print_usage();
                return EXIT_STARTUP_FAILURE;
            }
        }

        auto config = load_config(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return EXIT_STARTUP_FAILURE;
        }
        init_logging(config.value.log());

        if (fetch) {
            return run_fetch(config.value, rest);
        }
        return run_server(config.value, kill_existing && config.value.lock().kill_existing);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_STARTUP_FAILURE;
    }
}
