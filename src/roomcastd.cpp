#include "core/daemon_constants.h"
#include "daemon/app/app.h"
#include "daemon/core/pid_lock.h"
#include "logging/logger.h"

#include <iostream>
#include <string>
#include <unistd.h>

using namespace roomcast;

namespace {

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]" << '\n'
              << '\n'
              << "Options:" << '\n'
              << "  --config <path>     Config file (default: "
              << DaemonConstants::DEFAULT_CONFIG_FILE << ")" << '\n'
              << "  --endpoint <ep>     ZeroMQ command endpoint (overrides ipc.endpoint)" << '\n'
              << "  --source <name>     Source to start after boot "
                 "(none|librespot|bluetooth|roc)"
              << '\n'
              << "  --pid-file <path>   PID lock file (default: " << DaemonConstants::DEFAULT_PID_FILE
              << ")" << '\n'
              << "  --help              Show this help message" << '\n';
}

struct DaemonArgs {
    std::string configPath = DaemonConstants::DEFAULT_CONFIG_FILE;
    std::string pidFilePath = DaemonConstants::DEFAULT_PID_FILE;
    daemon_app::AppOverrides overrides;
};

// 0 = run, 1 = error, 2 = help printed
int parseArguments(int argc, char* argv[], DaemonArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 2;
        } else if (arg == "--config" && i + 1 < argc) {
            args.configPath = argv[++i];
        } else if (arg == "--endpoint" && i + 1 < argc) {
            args.overrides.endpoint = std::string(argv[++i]);
        } else if (arg == "--pid-file" && i + 1 < argc) {
            args.pidFilePath = argv[++i];
        } else if (arg == "--source" && i + 1 < argc) {
            std::string name = argv[++i];
            auto source = state::parseSource(name);
            if (!source) {
                std::cerr << "Unknown source: " << name << '\n';
                return 1;
            }
            args.overrides.initialSource = *source;
        } else {
            std::cerr << "Unknown option: " << arg << '\n';
            printUsage(argv[0]);
            return 1;
        }
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    DaemonArgs args;
    int parsed = parseArguments(argc, argv, args);
    if (parsed != 0) {
        return parsed == 2 ? 0 : 1;
    }

    // stderr only until the config's logging section has been read
    logging::initializeEarly();

    auto pidLock = daemon_core::PidLock::tryAcquire(args.pidFilePath);
    if (!pidLock) {
        return 1;
    }

    LOG_INFO("========================================");
    LOG_INFO("  roomcastd - multi-source audio control");
    LOG_INFO("========================================");
    LOG_INFO("PID: {} (file: {})", getpid(), pidLock->path());

    daemon_app::App app(args.configPath);
    int exitCode = app.run(args.overrides);

    logging::shutdown();
    return exitCode;
}
