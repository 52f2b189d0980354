// BatchCollapse Demo
// Reads "key value" lines from stdin and prints one line per flushed key.
// EOF or SIGTERM cancels the engine, which drains whatever is pending.

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "batchcollapse/batchcollapse.hpp"
#include "batchcollapse/pal/linux/linux_log_pal.hpp"
#include "batchcollapse/pal/linux/linux_signal_hook.hpp"

namespace {

void printUsage(const char* programName) {
    std::cout << "BatchCollapse Demo v" << batchcollapse::version() << "\n"
              << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config FILE     JSON configuration file\n"
              << "  --dump-config         Print the effective configuration and exit\n"
              << "  -h, --help            Show this help\n"
              << "\nInput: one \"key value\" pair per line on stdin.\n"
              << "\nExample:\n"
              << "  printf 'doc a\\ndoc b\\nimg c\\n' | BATCHCOLLAPSE_RETENTION_MS=200 "
              << programName << "\n"
              << std::endl;
}

/**
 * Reads stdin in chunks so that the input loop can notice a shutdown
 * signal while no input is arriving.
 */
class LineReader {
public:
    enum class Status { Line, Idle, End };

    Status next(std::string& line, int timeoutMs) {
        while (true) {
            auto newline = buffer_.find('\n');
            if (newline != std::string::npos) {
                line = buffer_.substr(0, newline);
                buffer_.erase(0, newline + 1);
                return Status::Line;
            }
            if (eof_) {
                if (buffer_.empty()) {
                    return Status::End;
                }
                line.swap(buffer_);
                buffer_.clear();
                return Status::Line;
            }

            struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
            int ready = poll(&pfd, 1, timeoutMs);
            if (ready == 0 || (ready < 0 && errno == EINTR)) {
                return Status::Idle;
            }
            if (ready < 0) {
                eof_ = true;
                continue;
            }

            char chunk[4096];
            ssize_t bytesRead = read(STDIN_FILENO, chunk, sizeof(chunk));
            if (bytesRead < 0 && errno == EINTR) {
                continue;
            }
            if (bytesRead <= 0) {
                eof_ = true;
                continue;
            }
            buffer_.append(chunk, static_cast<size_t>(bytesRead));
        }
    }

private:
    std::string buffer_;
    bool eof_ = false;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace batchcollapse;

    std::string configPath;
    bool dumpOnly = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--dump-config") {
            dumpOnly = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // Configuration
    core::ConfigManager configManager;
    configManager.setLogCallback([](const std::string& msg) {
        std::cerr << "[config] " << msg << std::endl;
    });

    if (!configPath.empty()) {
        auto loaded = configManager.loadFromFile(configPath);
        if (loaded.isError()) {
            std::cerr << "[ERROR] " << loaded.error().message;
            if (loaded.error().line > 0) {
                std::cerr << " (line " << loaded.error().line << ")";
            }
            std::cerr << std::endl;
            return 1;
        }
    }
    configManager.applyEnvironmentOverrides();

    auto valid = configManager.validate();
    if (valid.isError()) {
        std::cerr << "[ERROR] " << valid.error().message << std::endl;
        return 1;
    }

    if (dumpOnly) {
        std::cout << configManager.dumpConfig();
        return 0;
    }

    core::Configuration config = configManager.getConfig();

    // Logging
    pal::linux::LinuxLogOptions logOptions;
    logOptions.ident = "collapse_demo";
    logOptions.useSyslog = config.logging.syslog;
    logOptions.useStderr = config.logging.stderrOutput;
    auto logger = std::make_shared<pal::linux::LinuxLogPAL>(logOptions);
    logger->setMinLevel(config.logging.level);

    // Engine
    auto engineConfig = makeCollapseConfig<std::string>(
        config.collapse,
        [](const std::string& value) {
            std::cout << "flush: " << value << std::endl;
        });
    engineConfig.logger = logger;
    engineConfig.onExecuteError = [](const core::Error& error) {
        std::cerr << "[ERROR] " << error.toString() << std::endl;
    };

    core::KeyedBatchCollapse<std::string, std::string> engine(engineConfig);

    // Shutdown
    std::vector<int> signals;
    if (config.shutdown.handleSigterm) {
        signals.push_back(SIGTERM);
    }
    if (config.shutdown.handleSigint) {
        signals.push_back(SIGINT);
    }

    pal::linux::LinuxSignalHook signalHook(logger);
    signalHook.addShutdownCallback([&engine](int) {
        engine.cancel();
    });

    if (!signals.empty()) {
        auto installed = signalHook.install(signals);
        if (installed.isError()) {
            std::cerr << "[ERROR] " << installed.error().message << std::endl;
            return 1;
        }
    }

    // Input loop
    LineReader reader;
    std::string line;
    while (!signalHook.hasFired()) {
        LineReader::Status status = reader.next(line, 100);
        if (status == LineReader::Status::End) {
            break;
        }
        if (status == LineReader::Status::Idle) {
            continue;
        }

        std::istringstream fields(line);
        std::string key;
        std::string value;
        if (!(fields >> key)) {
            continue;
        }
        std::getline(fields >> std::ws, value);

        auto outcome = engine.collapse(key, value.empty() ? key : value);
        if (outcome == core::CollapseOutcome::Rejected) {
            std::cerr << "[WARN] pending key limit reached, dropped " << key << std::endl;
        }
    }

    if (signalHook.hasFired()) {
        // The drain runs on the signal watcher thread
        signalHook.waitForShutdown(std::chrono::seconds(5));
    } else {
        engine.cancel();
    }

    auto stats = engine.statistics();
    std::cerr << "collapsed " << stats.collapseCalls << " value(s): "
              << stats.flushed << " flushed, "
              << stats.drained << " drained, "
              << stats.rejected << " rejected" << std::endl;

    return 0;
}
