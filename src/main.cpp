#include "../include/Logger.h"
#include "../include/frontier_crawler/crawler/models/CrawlConfig.h"
#include "../include/frontier_crawler/storage/ContentSink.h"
#include "../include/frontier_crawler/storage/MongoFrontierStore.h"
#include "crawler/CrawlController.h"

#include <curl/curl.h>
#include <poll.h>
#include <unistd.h>
#include <execinfo.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using frontier_crawler::crawler::CrawlController;
using frontier_crawler::crawler::CrawlStats;
using frontier_crawler::frontier::TransitionOutcome;
using frontier_crawler::frontier::UrlStatus;
using frontier_crawler::frontier::transitionOutcomeToString;
using frontier_crawler::storage::ContentSink;
using frontier_crawler::storage::MongoFrontierStore;

namespace {

std::atomic<bool> interrupted{false};

// Crash handler to log a backtrace on segfaults
void installCrashHandler() {
    auto handler = [](int sig) {
        void* array[64];
        int size = backtrace(array, 64);
        char** messages = backtrace_symbols(array, size);
        std::cerr << "[FATAL] Signal " << sig << " received. Backtrace (" << size << "):\n";
        if (messages) {
            for (int i = 0; i < size; ++i) {
                std::cerr << messages[i] << "\n";
            }
        }
        std::cerr.flush();
        _exit(128 + sig);
    };
    std::signal(SIGSEGV, handler);
    std::signal(SIGABRT, handler);
}

void installInterruptHandler() {
    auto handler = [](int) { interrupted.store(true); };
    std::signal(SIGINT, handler);
    std::signal(SIGTERM, handler);
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --workers N        worker threads (0 = auto, default " << CrawlController::recommendedWorkerCount() << ")\n"
              << "  --delay SECONDS    per-thread delay between requests (default 1.0)\n"
              << "  --seed URL         seed URL or sitemap (repeatable)\n"
              << "  --mongo-uri URI    frontier store connection string\n"
              << "  --db NAME          frontier store database\n"
              << "  --output PATH      JSON Lines output file\n"
              << "  --no-verify-ssl    skip TLS certificate verification\n"
              << "  --log-level LEVEL  trace|debug|info|warning|error\n"
              << "  --verbose          also log to the console\n"
              << "  --help             show this message\n"
              << "Environment: MONGODB_URI, CRAWLER_DB_NAME, CRAWLER_WORKERS, CRAWLER_DELAY_MS,\n"
              << "  CRAWLER_USER_AGENT, CRAWLER_TIMEOUT_MS, CRAWLER_MAX_RETRIES, CRAWLER_VERIFY_SSL,\n"
              << "  CRAWLER_MAX_BODY_BYTES, CRAWLER_OUTPUT, CRAWLER_LOG_FILE, CRAWLER_LOG_LEVEL\n";
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  seed <url>              add a seed URL or sitemap\n"
              << "  pause <url>             pause one pending URL\n"
              << "  pause-prefix <prefix>   pause every pending URL starting with prefix\n"
              << "  resume <url>            resume a paused (or errored) URL\n"
              << "  resume-prefix <prefix>  resume every paused URL starting with prefix\n"
              << "  resume-all              resume every paused URL\n"
              << "  resume-domain <domain>  resume paused URLs on domain and its subdomains\n"
              << "  list-pending [prefix]   list pending URLs\n"
              << "  list-paused             list paused URLs\n"
              << "  stats [n]               totals and top-n breakdowns\n"
              << "  status                  counts per status\n"
              << "  stop | quit             stop workers and exit\n"
              << "  help                    show this help\n";
}

// Returns false when the program should exit with exitCode.
bool parseArguments(int argc, char* argv[], CrawlConfig& config, std::vector<std::string>& seeds,
                    bool& verbose, int& exitCode) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const std::string& name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        try {
            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                exitCode = 0;
                return false;
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else if (arg == "--no-verify-ssl") {
                config.verifySsl = false;
            } else if (arg == "--workers") {
                const char* value = needValue(arg);
                if (!value) { exitCode = 2; return false; }
                int workers = std::stoi(value);
                config.workerCount = workers < 0 ? 0 : static_cast<size_t>(workers);
            } else if (arg == "--delay") {
                const char* value = needValue(arg);
                if (!value) { exitCode = 2; return false; }
                double seconds = std::stod(value);
                if (seconds < 0) {
                    std::cerr << "Delay must be non-negative\n";
                    exitCode = 2;
                    return false;
                }
                config.politenessDelay = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
            } else if (arg == "--seed") {
                const char* value = needValue(arg);
                if (!value) { exitCode = 2; return false; }
                seeds.emplace_back(value);
            } else if (arg == "--mongo-uri") {
                const char* value = needValue(arg);
                if (!value) { exitCode = 2; return false; }
                config.mongoUri = value;
            } else if (arg == "--db") {
                const char* value = needValue(arg);
                if (!value) { exitCode = 2; return false; }
                config.databaseName = value;
            } else if (arg == "--output") {
                const char* value = needValue(arg);
                if (!value) { exitCode = 2; return false; }
                config.outputPath = value;
            } else if (arg == "--log-level") {
                const char* value = needValue(arg);
                if (!value) { exitCode = 2; return false; }
                config.logLevel = value;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                exitCode = 2;
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << "\n";
            exitCode = 2;
            return false;
        }
    }
    return true;
}

void printStats(const CrawlStats& stats) {
    std::cout << "\n=== Crawler Stats ===\n"
              << "Total URLs: " << stats.total << "\n"
              << "  Pending: " << stats.count(UrlStatus::PENDING)
              << "  Visited: " << stats.count(UrlStatus::VISITED)
              << "  Paused: " << stats.count(UrlStatus::PAUSED)
              << "  Error: " << stats.count(UrlStatus::ERROR) << "\n"
              << "Earliest seed: " << stats.earliestSeed.value_or("(none)") << "\n"
              << "Work queue: " << stats.queueSize << "\n";

    std::cout << "\nTop paused domains:\n";
    for (const auto& entry : stats.topPausedDomains) {
        std::cout << "  " << entry.first << ": " << entry.second << "\n";
    }
    std::cout << "\nTop paused prefixes (host[/first_segment]):\n";
    for (const auto& entry : stats.topPausedPrefixes) {
        std::cout << "  " << entry.first << ": " << entry.second << "\n";
    }
    std::cout << "\nTop domains overall:\n";
    for (const auto& entry : stats.domainDistribution) {
        std::cout << "  " << entry.first << ": " << entry.second << "\n";
    }
    std::cout << std::endl;
}

void printUrls(const Result<std::vector<std::string>>& urls, const std::string& emptyMessage) {
    if (!urls.success) {
        std::cout << "Error: " << urls.message << "\n";
        return;
    }
    if (urls.value.empty()) {
        std::cout << emptyMessage << "\n";
        return;
    }
    for (size_t i = 0; i < urls.value.size(); ++i) {
        std::cout << "  " << (i + 1) << ") " << urls.value[i] << "\n";
    }
    std::cout << urls.value.size() << " URL(s)\n";
}

void printTransition(const Result<TransitionOutcome>& outcome, const std::string& verb) {
    if (!outcome.success) {
        std::cout << "Error: " << outcome.message << "\n";
    } else if (outcome.value == TransitionOutcome::APPLIED) {
        std::cout << verb << ": " << outcome.message << "\n";
    } else {
        std::cout << "Not " << verb << " (" << transitionOutcomeToString(outcome.value) << "): "
                  << outcome.message << "\n";
    }
}

void printCount(const Result<size_t>& count, const std::string& verb) {
    if (count.success) {
        std::cout << verb << " " << count.value << " URL(s).\n";
    } else {
        std::cout << "Error: " << count.message << "\n";
    }
}

// Waits for a line on stdin while watching for Ctrl-C. False on EOF or interrupt.
bool readCommand(std::string& line) {
    while (!interrupted.load()) {
        if (std::cin.rdbuf()->in_avail() > 0) {
            return static_cast<bool>(std::getline(std::cin, line));
        }
        pollfd fd{STDIN_FILENO, POLLIN, 0};
        int ready = ::poll(&fd, 1, 500);
        if (ready > 0) {
            return static_cast<bool>(std::getline(std::cin, line));
        }
    }
    return false;
}

// Returns false when the operator asked to stop.
bool handleCommand(CrawlController& controller, const std::string& line) {
    std::istringstream in(line);
    std::string command;
    in >> command;
    std::string argument;
    std::getline(in >> std::ws, argument);

    if (command.empty()) {
        return true;
    }
    if (command == "stop" || command == "quit" || command == "exit") {
        return false;
    }
    if (command == "help") {
        printHelp();
    } else if (command == "seed") {
        if (argument.empty()) { std::cout << "Usage: seed <url>\n"; return true; }
        auto seeded = controller.seed(argument);
        std::cout << (seeded.success ? seeded.message : "Error: " + seeded.message) << "\n";
    } else if (command == "pause") {
        if (argument.empty()) { std::cout << "Usage: pause <url>\n"; return true; }
        printTransition(controller.pause(argument), "Paused");
    } else if (command == "pause-prefix") {
        if (argument.empty()) { std::cout << "Usage: pause-prefix <prefix>\n"; return true; }
        printCount(controller.pauseByPrefix(argument), "Paused");
    } else if (command == "resume") {
        if (argument.empty()) { std::cout << "Usage: resume <url>\n"; return true; }
        printTransition(controller.resume(argument), "Resumed");
    } else if (command == "resume-prefix") {
        if (argument.empty()) { std::cout << "Usage: resume-prefix <prefix>\n"; return true; }
        printCount(controller.resumeByPrefix(argument), "Resumed");
    } else if (command == "resume-all") {
        printCount(controller.resumeAllPaused(), "Resumed");
    } else if (command == "resume-domain") {
        if (argument.empty()) { std::cout << "Usage: resume-domain <domain>\n"; return true; }
        printCount(controller.resumeDomain(argument), "Resumed");
    } else if (command == "list-pending") {
        printUrls(controller.listPending(argument), "No pending URLs.");
    } else if (command == "list-paused") {
        printUrls(controller.listPaused(), "There are no paused URLs.");
    } else if (command == "stats") {
        size_t topN = 10;
        if (!argument.empty()) {
            try {
                topN = static_cast<size_t>(std::stoul(argument));
            } catch (const std::exception&) {
                std::cout << "Usage: stats [n]\n";
                return true;
            }
        }
        auto stats = controller.stats(topN);
        if (stats.success) {
            printStats(stats.value);
        } else {
            std::cout << "Error: " << stats.message << "\n";
        }
    } else if (command == "status") {
        auto counts = controller.statusCounts();
        if (!counts.success) {
            std::cout << "Error: " << counts.message << "\n";
        } else {
            auto count = [&counts](UrlStatus status) {
                auto it = counts.value.find(status);
                return it == counts.value.end() ? size_t{0} : it->second;
            };
            std::cout << "Pending: " << count(UrlStatus::PENDING)
                      << "  Visited: " << count(UrlStatus::VISITED)
                      << "  Paused: " << count(UrlStatus::PAUSED)
                      << "  Error: " << count(UrlStatus::ERROR)
                      << "  Queued: " << controller.queueSize() << "\n";
        }
    } else {
        std::cout << "Unknown command: " << command << " (type 'help')\n";
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    installCrashHandler();

    CrawlConfig config = CrawlConfig::fromEnvironment();
    std::vector<std::string> seeds;
    bool verbose = false;
    int exitCode = 0;
    if (!parseArguments(argc, argv, config, seeds, verbose, exitCode)) {
        return exitCode;
    }

    Logger::getInstance().init(Logger::parseLevel(config.logLevel), verbose, config.logFile,
                               config.logMaxBytes, config.logBackups);
    Logger::setThreadName("main");

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Failed to initialize libcurl\n";
        return 1;
    }

    int status = 0;
    try {
        auto store = std::make_shared<MongoFrontierStore>(config.mongoUri, config.databaseName,
                                                          config.maxRetries, config.collectionName);
        auto sink = std::make_shared<ContentSink>(config.outputPath, config.contentExcerptLength);
        CrawlController controller(config, store, sink);

        for (const auto& seed : seeds) {
            auto seeded = controller.seed(seed);
            std::cout << (seeded.success ? seeded.message : "Error: " + seeded.message) << "\n";
        }

        auto started = controller.start(config.workerCount);
        if (!started.success) {
            std::cerr << "Failed to start crawler: " << started.message << "\n";
            status = 1;
        } else {
            std::cout << "Crawler started with " << started.value << " worker(s), "
                      << controller.queueSize() << " URL(s) queued. Type 'help' for commands.\n";

            installInterruptHandler();
            std::string line;
            while (true) {
                std::cout << "> " << std::flush;
                if (!readCommand(line)) {
                    std::cout << "\n";
                    break;
                }
                if (!handleCommand(controller, line)) {
                    break;
                }
            }
        }

        std::cout << "Stopping crawler..." << std::endl;
        controller.stop();
        std::cout << "Crawler stopped. " << sink->recordsWritten() << " page(s) written to "
                  << sink->path() << "\n";
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Fatal: ") + e.what());
        std::cerr << "Fatal: " << e.what() << "\n";
        status = 1;
    }

    curl_global_cleanup();
    Logger::getInstance().close();
    return status;
}
