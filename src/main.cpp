#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/json.hpp>

#include <csignal>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "errors.hpp"
#include "generator_process.hpp"
#include "logger.hpp"
#include "memory_store.hpp"
#include "metrics.hpp"
#include "pool_config.hpp"
#include "pool_manager.hpp"
#include "redis_store.hpp"

namespace net = boost::asio;
namespace json = boost::json;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options] <command>\n"
              << "Commands:\n"
              << "  get [N]              Print N request header sets (default 1)\n"
              << "  warm                 Fill the credential pool to its target and exit\n"
              << "  stats                Print pool statistics and metrics\n"
              << "Options:\n"
              << "  --memory, -m         Use the in-process store instead of Redis\n"
              << "  --generator <path>   Path to the generator executable\n"
              << "  --help, -h           Show this help\n";
}

// Relative generator paths that do not exist in the working directory are
// resolved against the directory holding this executable.
std::string resolve_generator_path(const std::string& configured) {
    std::filesystem::path path(configured);
    if (path.is_absolute() || std::filesystem::exists(path)) {
        return configured;
    }
    try {
        auto exe_dir = std::filesystem::canonical("/proc/self/exe").parent_path();
        return (exe_dir / path).string();
    } catch (const std::exception& e) {
        std::cerr << "[!] Warning: Could not detect executable path via /proc/self/exe: " << e.what() << std::endl;
        return configured;
    }
}

int run_get(credpool::PoolManager& pool, int count) {
    for (int i = 0; i < count; ++i) {
        json::object obj;
        for (const auto& [name, value] : pool.get_headers()) {
            obj[name] = value;
        }
        std::cout << json::serialize(obj) << "\n";
    }
    return 0;
}

int run_warm(credpool::PoolManager& pool) {
    net::io_context ioc;
    bool interrupted = false;

    // Captured SIGINT and SIGTERM to cancel the warm-up cleanly
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        credpool::Logger::log(credpool::Logger::Level::INFO, credpool::Logger::EventType::LIFECYCLE,
                              "Interrupted, closing pool");
        interrupted = true;
        pool.close();
        ioc.stop();
    });

    net::steady_timer poll_timer(ioc);
    std::function<void(const boost::system::error_code&)> on_poll;
    on_poll = [&](const boost::system::error_code& ec) {
        if (ec) return;
        if (!pool.is_warming_up()) {
            signals.cancel();
            ioc.stop();
            return;
        }
        poll_timer.expires_after(std::chrono::milliseconds(200));
        poll_timer.async_wait(on_poll);
    };

    pool.trigger_warmup();
    poll_timer.expires_after(std::chrono::milliseconds(0));
    poll_timer.async_wait(on_poll);
    ioc.run();

    auto stats = pool.store().stats();
    std::cout << "[*] Pool: " << stats.fresh << " fresh / " << stats.total << " total\n";
    return interrupted ? 130 : 0;
}

int run_stats(credpool::CredentialStore& store) {
    auto stats = store.stats();
    std::cout << "total " << stats.total << "\n"
              << "fresh " << stats.fresh << "\n"
              << "exhausted " << stats.exhausted << "\n"
              << "cooled " << stats.cooled << "\n";
    credpool::MetricsRegistry::instance().set_gauge("pool_available", static_cast<double>(stats.fresh));
    std::cout << credpool::MetricsRegistry::instance().collect_prometheus();
    return 0;
}

}

int main(int argc, char* argv[]) {
    using credpool::Logger;
    try {
        credpool::PoolConfig config;
        credpool::apply_env_overrides(config);

        // --- CLI Argument Parsing ---
        std::string command;
        int count = 1;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--memory" || arg == "-m") {
                config.store_backend = "memory";
            } else if (arg == "--generator") {
                if (i + 1 >= argc) {
                    std::cerr << "[!] --generator requires a path\n";
                    return 1;
                }
                config.generator_path = argv[++i];
            } else if (command.empty()) {
                command = arg;
            } else if (command == "get") {
                try {
                    count = std::stoi(arg);
                } catch (const std::exception&) {
                    std::cerr << "[!] Invalid count: " << arg << "\n";
                    return 1;
                }
                if (count < 1) {
                    std::cerr << "[!] Count must be positive: " << arg << "\n";
                    return 1;
                }
            } else {
                std::cerr << "[!] Unexpected argument: " << arg << "\n";
                return 1;
            }
        }

        if (command != "get" && command != "warm" && command != "stats") {
            print_usage(argv[0]);
            return 1;
        }

        credpool::validate(config);
        Logger::Level level = Logger::Level::INFO;
        if (Logger::parse_level(config.log_level, level)) {
            Logger::set_min_level(level);
        }

        config.generator_path = resolve_generator_path(config.generator_path);

        std::unique_ptr<credpool::CredentialStore> store;
        if (config.store_backend == "memory") {
            Logger::log(Logger::Level::WARNING, Logger::EventType::STORE,
                        "Using in-process store; pool state will not survive this run");
            store = std::make_unique<credpool::MemoryStore>(config);
        } else {
            auto redis = std::make_unique<credpool::RedisStore>(config);
            if (!redis->is_connected()) {
                std::cerr << "[!] Redis is unreachable at " << config.redis_url << "\n";
                return 1;
            }
            store = std::move(redis);
        }

        if (command == "stats") {
            return run_stats(*store);
        }

        credpool::PoolManager pool(config, *store, std::make_unique<credpool::GeneratorProcess>(config));

        int rc = (command == "get") ? run_get(pool, count) : run_warm(pool);
        pool.close();
        return rc;

    } catch (const credpool::GeneratorError& e) {
        std::cerr << "[!] Generator error: " << e.what() << "\n";
        if (!e.stderr_output().empty()) {
            std::cerr << "[!] Generator stderr:\n" << e.stderr_output() << "\n";
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
