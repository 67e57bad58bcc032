#include "core/config.hpp"
#include "core/logging.hpp"
#include "engine/book_service.hpp"
#include "orderbook/book_metrics.hpp"
#include "output/console_logger.hpp"
#include "output/json_formatter.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

boost::asio::io_context* g_ioc = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_ioc != nullptr) {
            g_ioc->stop();
        }
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] -t <token_id> [-t <token_id> ...]\n"
              << "\nOptions:\n"
              << "  -t, --token <id>       Token id to follow (repeatable)\n"
              << "  -c, --config <path>    Load configuration from JSON file\n"
              << "  -d, --depth <n>        Levels per side to show\n"
              << "  -j, --json             Emit JSON lines on stdout (logs go to stderr)\n"
              << "  -l, --log-level <lvl>  trace, debug, info, warn, error\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  BOOKSYNC_WS_HOST       Market channel host\n"
              << "  BOOKSYNC_WS_PATH       Market channel path\n"
              << "  BOOKSYNC_REST_HOST     REST API host\n"
              << "  BOOKSYNC_LINGER_MS     Keep-open time after the last release\n"
              << "  BOOKSYNC_SNAPSHOT_TIMEOUT_MS  Snapshot fetch timeout\n"
              << "  BOOKSYNC_LOG_LEVEL     Log level\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "booksync v1.0.0\n"
              << "Order book synchronization for Polymarket CLOB\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::vector<std::string> tokens;
    std::optional<std::size_t> depth;
    std::optional<std::string> log_level;
    bool json = false;
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "-j" || arg == "--json") {
            args.json = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-t" || arg == "--token") && i + 1 < argc) {
            args.tokens.emplace_back(argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if ((arg == "-d" || arg == "--depth") && i + 1 < argc) {
            const char* value = argv[++i];
            char* end = nullptr;
            auto parsed = std::strtoul(value, &end, 10);
            if (end != value && *end == '\0') {
                args.depth = static_cast<std::size_t>(parsed);
            } else {
                std::cerr << "Ignoring invalid depth '" << value << "'" << std::endl;
            }
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
        }
    }

    return args;
}

/// Prints every followed instrument on a fixed interval
class Monitor {
public:
    Monitor(boost::asio::io_context& ioc, const booksync::BookService& service,
            std::vector<booksync::InstrumentId> instruments, const booksync::Config::Output& config)
        : service_(service)
        , instruments_(std::move(instruments))
        , config_(config)
        , console_(config.depth_levels)
        , timer_(ioc)
    {}

    void start() {
        timer_.expires_after(config_.console_interval);
        timer_.async_wait([this](auto ec) {
            if (ec) {
                return;
            }
            print();
            start();
        });
    }

    void stop() {
        timer_.cancel();
    }

    void print_status(booksync::network::ConnectionState state) {
        if (config_.json) {
            std::cout << booksync::output::JsonFormatter::format_status(state).dump() << std::endl;
        } else {
            console_.log_connection_state(state);
        }
    }

private:
    void print() {
        const booksync::Size fill_size{config_.fill_size};

        for (const auto& id : instruments_) {
            auto best = service_.best_prices(id);
            auto full_depth = service_.depth(id);
            auto shown_depth = service_.depth(id, config_.depth_levels);
            auto fill = booksync::book_metrics::simulate_fill(full_depth, booksync::Side::Bid, fill_size);
            auto last_trade = service_.last_trade(id);
            bool stale = service_.is_stale(id);

            if (config_.json) {
                auto j = booksync::output::JsonFormatter::format_book(id, best, shown_depth, last_trade, stale);
                j["buyFill"] = booksync::output::JsonFormatter::format_fill(fill);
                std::cout << j.dump() << std::endl;
            } else {
                console_.log_book(id, best, fill, last_trade, stale);
                console_.log_depth(id, shown_depth);
            }
        }
    }

    const booksync::BookService& service_;
    std::vector<booksync::InstrumentId> instruments_;
    booksync::Config::Output config_;
    booksync::output::ConsoleLogger console_;
    boost::asio::steady_timer timer_;
};

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Load configuration with priority: CLI > env > file > defaults
    auto config = booksync::Config::load(args.config_path);

    // CLI argument overrides (highest priority)
    if (args.depth) {
        config.output.depth_levels = *args.depth;
    }
    if (args.json) {
        config.output.json = true;
    }
    if (args.log_level) {
        config.logging.level = *args.log_level;
    }

    booksync::setup_logging(config.logging.level, config.output.json);

    if (args.tokens.empty()) {
        std::cerr << "At least one --token is required\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    spdlog::info("Market channel: {}:{}{}", config.network.ws_host, config.network.ws_port, config.network.ws_path);
    spdlog::info("REST API: {}:{}", config.network.rest_host, config.network.rest_port);

    boost::asio::io_context ioc;
    g_ioc = &ioc;

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int exit_code = 0;
    try {
        booksync::BookService service(ioc, config);
        service.init();

        auto subscription = service.subscribe(args.tokens);
        if (!subscription.active()) {
            spdlog::error("No valid token ids given");
            exit_code = 1;
        } else {
            Monitor monitor(ioc, service, subscription.instruments(), config.output);
            auto listener = service.add_connection_listener([&monitor](auto state) {
                monitor.print_status(state);
            });
            monitor.start();

            ioc.run();

            spdlog::info("Shutdown requested");
            monitor.stop();
            service.remove_connection_listener(listener);
            subscription.release();
        }

        service.teardown();

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        exit_code = 1;
    }

    g_ioc = nullptr;
    spdlog::shutdown();
    return exit_code;
}
