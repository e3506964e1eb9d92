#include "ogcode/config/ConfigFile.hpp"
#include "ogcode/job/JobCompiler.hpp"
#include "ogcode/log/Log.hpp"
#include "ogcode/stream/RecordingSink.hpp"
#include "ogcode/stream/TcpFrameSink.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

using namespace ogcode;

namespace {

constexpr int EXIT_USAGE = 1;

std::atomic<bool> interrupted{false};

void onInterrupt(int) {
    interrupted.store(true);
}

void printUsage() {
    std::cerr << "usage: ogcode <job.gcode> [--config <file>] [--output <file>] [--tcp <host:port>]\n"
              << "              [--quiet | --silent]\n"
              << "  --config  job configuration (planner, laser, emitter, calibration, network keys)\n"
              << "  --output  write frames to a recording file (default: <job>.xy2)\n"
              << "  --tcp     stream frames to a network bridge instead of a file\n"
              << "  --quiet   only log warnings and errors\n"
              << "  --silent  log nothing; failures are still reported on exit\n";
}

struct Options {
    std::string jobPath;
    std::string configPath;
    std::string outputPath;
    std::string tcpHost;
    std::uint16_t tcpPort = 0;
    LogLevel logLevel = LogLevel::Info;
};

bool parseArguments(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << "\n";
                return false;
            }
            target = argv[++i];
            return true;
        };
        if (arg == "--quiet") {
            options.logLevel = LogLevel::Warning;
        } else if (arg == "--silent") {
            options.logLevel = LogLevel::Off;
        } else if (arg == "--config") {
            if (!value(options.configPath)) return false;
        } else if (arg == "--output") {
            if (!value(options.outputPath)) return false;
        } else if (arg == "--tcp") {
            std::string endpoint;
            if (!value(endpoint)) return false;
            const auto colon = endpoint.rfind(':');
            if (colon == std::string::npos || colon == 0) {
                std::cerr << "--tcp expects host:port\n";
                return false;
            }
            options.tcpHost = endpoint.substr(0, colon);
            const std::string port = endpoint.substr(colon + 1);
            char* end = nullptr;
            const long number = std::strtol(port.c_str(), &end, 10);
            if (port.empty() || *end != '\0' || number <= 0 || number > 65535) {
                std::cerr << "invalid port '" << port << "'\n";
                return false;
            }
            options.tcpPort = static_cast<std::uint16_t>(number);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "unknown option " << arg << "\n";
            return false;
        } else if (options.jobPath.empty()) {
            options.jobPath = arg;
        } else {
            std::cerr << "more than one job file given\n";
            return false;
        }
    }
    if (options.jobPath.empty()) {
        return false;
    }
    if (!options.tcpHost.empty() && !options.outputPath.empty()) {
        std::cerr << "--output and --tcp are mutually exclusive\n";
        return false;
    }
    if (options.tcpHost.empty() && options.outputPath.empty()) {
        options.outputPath = options.jobPath + ".xy2";
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage();
        return EXIT_USAGE;
    }
    setLogLevel(options.logLevel);

    config::LoadedConfig loaded;
    if (!options.configPath.empty()) {
        auto parsed = config::loadConfigFile(options.configPath);
        if (!parsed) {
            std::cerr << parsed.error().describe() << "\n";
            return EXIT_USAGE;
        }
        loaded = std::move(*parsed);
    }

    std::ifstream jobFile(options.jobPath);
    if (!jobFile) {
        std::cerr << "cannot open job '" << options.jobPath << "'\n";
        return EXIT_USAGE;
    }
    std::ostringstream program;
    program << jobFile.rdbuf();

    std::unique_ptr<stream::FrameSink> sink;
    if (!options.tcpHost.empty()) {
        auto tcp = std::make_unique<stream::TcpFrameSink>(loaded.job.network);
        if (auto connected = tcp->connect(options.tcpHost, options.tcpPort); !connected) {
            std::cerr << connected.error().describe() << "\n";
            return EXIT_USAGE;
        }
        sink = std::move(tcp);
    } else {
        auto recording = stream::RecordingSink::open(options.outputPath, loaded.job.emitter.samplePeriod);
        if (!recording) {
            std::cerr << recording.error().describe() << "\n";
            return EXIT_USAGE;
        }
        sink = std::move(*recording);
    }

    job::JobCompiler compiler(loaded.job,
                              std::make_shared<const calibration::CalibrationProfile>(loaded.calibration));

    // Ctrl-C cancels the job; the compiler then parks the mirrors with the laser off.
    std::signal(SIGINT, onInterrupt);
    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        while (!finished.load()) {
            if (interrupted.exchange(false)) {
                compiler.cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    });

    auto result = compiler.run(program.str(), *sink);
    finished.store(true);
    watcher.join();

    if (!result) {
        std::cerr << "ogcode: " << core::describe(result.error()) << "\n";
        return job::exitCodeFor(result.error());
    }
    logInfo("[ogcode] done: ", result->framesDelivered, " frames streamed\n");
    return 0;
}
