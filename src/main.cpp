#include "core/config.hpp"
#include "engine/scanner_service.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

std::unique_ptr<optiscan::engine::ScannerService> g_service;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_service) {
            g_service->request_shutdown();
        }
    }
}

void print_banner() {
    std::cout << "\noptiscan\n" << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>     Load configuration from JSON file\n"
              << "  -w, --watchlist <syms>  Comma-separated symbols (e.g., SPY,QQQ)\n"
              << "      --once              Run one scan cycle and exit\n"
              << "      --report            Run one performance report and exit\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --version           Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  OPTISCAN_WATCHLIST                 Comma-separated symbols\n"
              << "  OPTISCAN_SCAN_INTERVAL_SECONDS     Seconds between scan cycles\n"
              << "  OPTISCAN_MAX_CONCURRENCY           Parallel chain fetches\n"
              << "  OPTISCAN_MIN_NOTIONAL_VALUE        Whale notional minimum (USD)\n"
              << "  OPTISCAN_UNUSUAL_VOLUME_MULTIPLIER Volume/baseline ratio threshold\n"
              << "  OPTISCAN_MIN_TRADE_SIZE            Whale absolute size minimum\n"
              << "  OPTISCAN_LOOKBACK_DAYS             Baseline lookback window\n"
              << "  OPTISCAN_MARKET_DATA_HOST          Market-data API host\n"
              << "  OPTISCAN_MARKET_DATA_PORT          Market-data API port\n"
              << "  OPTISCAN_MARKET_DATA_API_KEY       Market-data API key\n"
              << "  OPTISCAN_STORE_PATH                JSON-lines store path\n"
              << "  OPTISCAN_TELEGRAM_TOKEN            Telegram bot token\n"
              << "  OPTISCAN_TELEGRAM_CHAT_ID          Telegram chat id\n"
              << "  OPTISCAN_LOG_LEVEL                 trace|debug|info|warn|error\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "optiscan v1.0.0\n"
              << "Options flow anomaly scanner and backtester\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> watchlist;
    bool once = false;
    bool report = false;
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
        } else if (arg == "--once") {
            args.once = true;
        } else if (arg == "--report") {
            args.report = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-w" || arg == "--watchlist") && i + 1 < argc) {
            args.watchlist = argv[++i];
        } else {
            std::cerr << "Warning: ignoring unknown argument '" << arg << "'" << std::endl;
        }
    }

    return args;
}

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

    print_banner();

    // Load configuration with priority: CLI > env > file > defaults
    auto config = optiscan::Config::load(args.config_path);

    if (args.watchlist) {
        config.scanner.watchlist = optiscan::parse_watchlist(*args.watchlist);
    }

    // Invalid thresholds are fatal before the first cycle
    auto violations = config.validate();
    if (!violations.empty()) {
        std::cerr << "Invalid configuration:\n";
        for (const auto& violation : violations) {
            std::cerr << "  - " << violation << "\n";
        }
        std::cerr << std::flush;
        return 2;
    }

    std::cout << "Configuration:\n"
              << "  Watchlist: " << config.scanner.watchlist.size() << " symbols\n"
              << "  Scan interval: " << config.scanner.scan_interval.count() << "s\n"
              << "  Market data: " << config.market_data.host << ":" << config.market_data.port << "\n"
              << "  Store: " << config.storage.path << "\n"
              << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        g_service = std::make_unique<optiscan::engine::ScannerService>(config);

        auto opened = g_service->open();
        if (opened.is_err()) {
            std::cerr << "Fatal error: " << opened.error().describe() << std::endl;
            g_service.reset();
            return 1;
        }

        if (args.once || args.report) {
            if (args.once) {
                [[maybe_unused]] auto cycle = g_service->run_once();
            }
            if (args.report) {
                [[maybe_unused]] auto report = g_service->report_once();
            }
        } else {
            g_service->run();
        }
        g_service.reset();

        std::cout << "Goodbye!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
