#include "client.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "metrics.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

struct Config {
    std::string        baseUrl   = notion_sync::kDefaultBaseUrl;
    std::string        token;
    std::string        query;
    std::string        object;             // "page" or "database" filter
    int                pageSize  = 100;
    std::optional<int> pages;
    std::optional<int> results;
    std::optional<int> timeoutMs;
    std::optional<int> opTimeoutMs;
    int                retries   = notion_sync::kDefaultRetries;
    int                backoffMs = static_cast<int>(notion_sync::kDefaultBackoff.count());
    bool               verbose   = false;
};

static void printUsage() {
    std::cout
        << "Usage: notion_sync [options]\n\n"
        << "Runs a search and prints every result.\n\n"
        << "Options:\n"
        << "  --base-url URL       API base URL             "
           "(default: https://api.notion.com/v1)\n"
        << "  --token TOKEN        Integration token (sent as Bearer)\n"
        << "  --query TEXT         Search text               (default: empty)\n"
        << "  --object TYPE        Filter on page|database\n"
        << "  --page-size N        Results per request       (default: 100)\n"
        << "  --pages N            Stop after N requests\n"
        << "  --results N          Stop after N results\n"
        << "  --timeout-ms N       Per-request timeout\n"
        << "  --op-timeout-ms N    Timeout for the whole run\n"
        << "  --retries N          Retry budget              (default: 3)\n"
        << "  --backoff-ms N       Base backoff              (default: 500)\n"
        << "  --verbose            Enable verbose diagnostics\n"
        << "  --help, -h           Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--base-url") && i + 1 < argc) {
            cfg.baseUrl = argv[++i];
        } else if ((arg == "--token") && i + 1 < argc) {
            cfg.token = argv[++i];
        } else if ((arg == "--query") && i + 1 < argc) {
            cfg.query = argv[++i];
        } else if ((arg == "--object") && i + 1 < argc) {
            cfg.object = argv[++i];
        } else if ((arg == "--page-size") && i + 1 < argc) {
            cfg.pageSize = std::stoi(argv[++i]);
        } else if ((arg == "--pages") && i + 1 < argc) {
            cfg.pages = std::stoi(argv[++i]);
        } else if ((arg == "--results") && i + 1 < argc) {
            cfg.results = std::stoi(argv[++i]);
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if ((arg == "--op-timeout-ms") && i + 1 < argc) {
            cfg.opTimeoutMs = std::stoi(argv[++i]);
        } else if ((arg == "--retries") && i + 1 < argc) {
            cfg.retries = std::stoi(argv[++i]);
        } else if ((arg == "--backoff-ms") && i + 1 < argc) {
            cfg.backoffMs = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    using namespace notion_sync;

    try {
        Config cfg = parseArgs(argc, argv);

        std::cout
            << "=== notion_sync ===\n"
            << "Base URL:   " << cfg.baseUrl  << "\n"
            << "Query:      \"" << cfg.query  << "\"\n"
            << "Page size:  " << cfg.pageSize << "\n"
            << "Retries:    " << cfg.retries  << "\n"
            << "Verbose:    " << (cfg.verbose ? "yes" : "no") << "\n"
            << "===================\n\n";

        HttpConfig http;
        http.baseUrl = cfg.baseUrl;
        http.retries = cfg.retries;
        http.backoff = std::chrono::milliseconds(cfg.backoffMs);
        if (!cfg.token.empty()) http.token = cfg.token;
        if (cfg.timeoutMs) http.timeout = std::chrono::milliseconds(*cfg.timeoutMs);

        OperatorConfig op;
        op.limits.pages   = cfg.pages;
        op.limits.results = cfg.results;
        if (cfg.opTimeoutMs) op.timeout = std::chrono::milliseconds(*cfg.opTimeoutMs);

        nlohmann::json request = {{"query", cfg.query}, {"page_size", cfg.pageSize}};
        if (!cfg.object.empty()) {
            request["filter"] = {{"property", "object"}, {"value", cfg.object}};
        }

        HttpClient transport(cfg.baseUrl, cfg.verbose);
        Client     client(transport, http, cfg.verbose);
        auto       search = client.search(request, op);

        std::cout << "--- Results ---\n";
        std::size_t index = 0;
        while (auto page = search->next()) {
            for (const auto& result : page->results) {
                std::cout << std::setw(5) << ++index << "  "
                          << std::left << std::setw(10) << result.value("object", "")
                          << "  " << result.value("id", "") << std::right << "\n";
            }
        }

        const auto snapshot = search->reporter().snapshot();
        std::cout
            << "\n=== Summary Report ===\n"
            << "Status:          " << toString(search->stream().status()) << "\n"
            << "Stage:           " << toString(snapshot.stage)            << "\n"
            << "Total results:   " << snapshot.items                      << "\n"
            << "Total requests:  " << snapshot.requests                   << "\n"
            << "Total errors:    " << snapshot.errors                     << "\n"
            << "Message:         " << snapshot.message.value_or("-")     << "\n"
            << "======================\n";

        search->stream().rethrowIfFailed();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
