// Engine
#include "thumb/Service.hpp"
#include "thumb/ReadySink.hpp"

// Storage and decoding
#include "db/SqliteStore.hpp"
#include "preview/Decoder.hpp"

// Serving
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <boost/asio.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>

using namespace tf::config;
using namespace tf::log;

namespace {
std::atomic<bool> shouldExit = false;
std::atomic<int> lastSignal = 0;

void signalHandler(const int signum) {
    lastSignal = signum;
    shouldExit = true;
}

struct Options {
    std::filesystem::path configPath = "thumbforge.yaml";
    std::vector<std::filesystem::path> warmDirs;
    bool dumpConfig = false;
};

void printUsage() {
    fmt::print("usage: thumbforge [config.yaml] [--warm <dir>]... [--dump-config]\n");
}

Options parseArgs(const int argc, char** argv) {
    Options opts;
    bool configSeen = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--warm") {
            if (i + 1 >= argc) throw std::invalid_argument("--warm requires a directory");
            opts.warmDirs.emplace_back(argv[++i]);
        } else if (arg == "--dump-config") {
            opts.dumpConfig = true;
        } else if (!arg.starts_with("--") && !configSeen) {
            opts.configPath = arg;
            configSeen = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return opts;
}

// Runs the io_context on its own thread; stops and joins on scope exit,
// including during unwinding
class IoThread {
public:
    explicit IoThread(boost::asio::io_context& ioc) : ioc_(ioc), thread_([this] { ioc_.run(); }) {}

    ~IoThread() {
        ioc_.stop();
        if (thread_.joinable()) thread_.join();
    }

    IoThread(const IoThread&) = delete;
    IoThread& operator=(const IoThread&) = delete;

private:
    boost::asio::io_context& ioc_;
    std::thread thread_;
};
}

int main(const int argc, char** argv) {
    Options opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        fmt::print(stderr, "{}\n", e.what());
        printUsage();
        return 2;
    }

    try {
        ConfigRegistry::init(opts.configPath);
        const auto& cfg = ConfigRegistry::get();
        Registry::init(cfg.logging);

        if (opts.dumpConfig) {
            fmt::print("{}\n", nlohmann::json(cfg).dump(2));
            return EXIT_SUCCESS;
        }

        Registry::thumbforge()->info("[*] Initializing thumbforge...");

        tf::db::SqliteStore store(cfg.database.path);
        tf::preview::Decoder decoder(cfg.thumbnails.thumbnail_size, cfg.thumbnails.jpeg_quality);
        tf::thumb::LoggingReadySink sink;

        tf::thumb::Service service(cfg.engine(), store, decoder, sink);
        service.start();

        boost::asio::io_context ioc;
        std::shared_ptr<tf::http::Server> server;
        std::unique_ptr<IoThread> ioThread;
        if (cfg.http.enabled) {
            const auto router = std::make_shared<const tf::http::Router>(service);
            const boost::asio::ip::tcp::endpoint ep{boost::asio::ip::make_address(cfg.http.host), cfg.http.port};
            server = std::make_shared<tf::http::Server>(ioc, ep, router);
            server->run();
            ioThread = std::make_unique<IoThread>(ioc);
        }

        for (const auto& dir : opts.warmDirs) service.warmDirectory(dir.string());

        Registry::thumbforge()->info("[✓] thumbforge started");

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        Registry::thumbforge()->info("[!] Signal {} received. Shutting down gracefully...", lastSignal.load());

        ioThread.reset();
        if (server) server->stop();

        service.stop();

        Registry::thumbforge()->info("[✓] thumbforge shut down cleanly.");
        Registry::shutdown();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        Registry::thumbforge()->error("[-] Failed to run thumbforge: {}", e.what());
        return EXIT_FAILURE;
    }
}
