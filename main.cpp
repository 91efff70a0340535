// Upload
#include "upload/Orchestrator.hpp"
#include "upload/UploadManager.hpp"

// Storage
#include "storage/LocalTransport.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <boost/asio.hpp>
#include <csignal>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace vl::config;
using namespace vl::concurrency;
using namespace vl::storage;
using namespace vl::upload;
using namespace vl::types;
using namespace vl::events;
using namespace vl::logging;

namespace {

struct Args {
    std::optional<std::string> configPath;
    std::optional<int> limit;
    std::vector<std::string> files;
};

void usage() {
    std::cerr << "usage: vidlift [-c|--config <config.yaml>] [-j|--parallel <1-5>] <file>...\n";
}

std::optional<Args> parseArgs(const int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) args.configPath = argv[++i];
        else if ((arg == "-j" || arg == "--parallel") && i + 1 < argc) {
            try {
                args.limit = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        else if (arg == "-h" || arg == "--help") return std::nullopt;
        else if (!arg.empty() && arg[0] == '-') return std::nullopt;
        else args.files.push_back(arg);
    }
    if (args.files.empty()) return std::nullopt;
    return args;
}

void initLogging(const LoggingConfig& cnf) {
    try {
        LogRegistry::init(cnf);
    } catch (const std::exception& e) {
        LogRegistry::initConsoleOnly(cnf.levels.console_log_level);
        LogRegistry::vidlift()->warn("[*] Falling back to console logging: {}", e.what());
    }
}

}

int main(const int argc, char** argv) {
    const auto args = parseArgs(argc, argv);
    if (!args) {
        usage();
        return 2;
    }

    try {
        ConfigRegistry::init(args->configPath ? loadConfig(*args->configPath) : Config{});
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    auto config = ConfigRegistry::get();
    if (args->limit) config.upload.parallel_file_limit = *args->limit;
    initLogging(config.logging);

    try {
        boost::asio::io_context ioc;

        auto workers = std::make_shared<ThreadPool>(config.upload.threadCount());
        auto transport = std::make_shared<LocalTransport>(config.transport.root, config.transport.quota_bytes);
        auto userData = std::make_shared<UserData>(config.credentials);

        Orchestrator::Options options;
        options.config = config.upload;
        options.taskFactory = UploadManager::factory(ioc.get_executor(), workers, transport, config.upload);
        options.userData = userData;
        options.events = {
            {EventType::Error, [](const nlohmann::json& err) {
                LogRegistry::vidlift()->error("[!] {} (code {})", err.value("message", std::string{}), err.value("code", 0));
            }},
            {EventType::UploadComplete, [](const nlohmann::json&) {
                LogRegistry::vidlift()->info("[*] All uploads finished");
            }}
        };

        const auto orchestrator = Orchestrator::create(ioc.get_executor(), std::move(options));

        const Handlers fileEvents = {
            {EventType::FileProgress, [](const nlohmann::json& e) {
                LogRegistry::vidlift()->debug("[*] {} {:.1f}%", e["fileData"].value("title", std::string{}),
                                              e.value("progress", 0.0) * 100.0);
            }},
            {EventType::FileSucceed, [](const nlohmann::json& e) {
                LogRegistry::vidlift()->info("[+] {} -> {}", e["fileData"].value("title", std::string{}),
                                             e["fileData"].value("vid", std::string{}));
            }},
            {EventType::FileFailed, [](const nlohmann::json& e) {
                LogRegistry::vidlift()->error("[-] {}: {}", e["fileData"].value("title", std::string{}),
                                              e["errData"].value("message", std::string{}));
            }}
        };

        size_t rejected = 0;
        for (const auto& file : args->files) {
            try {
                orchestrator->addFile(FileSource{file, {}, {}}, fileEvents);
            } catch (const std::exception& e) {
                ++rejected;
                LogRegistry::vidlift()->warn("[!] Skipping {}: {}", file, e.what());
            }
        }

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM, SIGHUP);
        std::function<void(const boost::system::error_code&, int)> onSignal;
        onSignal = [&](const boost::system::error_code& ec, const int signum) {
            if (ec) return;
            if (signum == SIGHUP) {
                LogRegistry::reopenMainLog();
                signals.async_wait(onSignal);
                return;
            }
            LogRegistry::vidlift()->info("[!] Signal {} received. Stopping uploads...", signum);
            orchestrator->stopAll();
        };
        signals.async_wait(onSignal);

        orchestrator->startAll();
        while (!ioc.stopped()) {
            ioc.run_one();
            if (orchestrator->isIdle()) break;
        }

        // rejected runs still hold their slots
        if (orchestrator->uploadPool().size() != 0) orchestrator->stopAll();

        signals.cancel();
        workers->stop();

        size_t succeeded = 0;
        for (const auto& f : orchestrator->files())
            if (!f.vid.empty()) ++succeeded;

        const auto total = orchestrator->files().size();
        LogRegistry::vidlift()->info("[*] {} of {} files uploaded, {} rejected", succeeded, total, rejected);
        return succeeded == total && rejected == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        LogRegistry::vidlift()->critical("[!] Fatal: {}", e.what());
        return 1;
    }
}
