/// toolbridge: serves configured tools over stdio and forwards each call to
/// a worker subprocess.
///
/// Usage: toolbridge [--config FILE] [--log-level LEVEL] [-- worker-cmd args...]

#include <toolbridge/toolbridge.hpp>

#include <log4cplus/initializer.h>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <pthread.h>
#include <signal.h>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config FILE] [--log-level LEVEL] [-- worker-cmd args...]\n";
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    std::string config_path;
    std::string log_level;
    std::vector<std::string> worker_cmd;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "toolbridge " << toolbridge::LIBRARY_VERSION
                      << " (protocol " << toolbridge::PROTOCOL_VERSION << ")" << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            config_path = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            log_level = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--log-level=", 12) == 0) {
            log_level = argv[i] + 12;
            continue;
        }

        if (strcmp(argv[i], "--") == 0) {
            worker_cmd.assign(argv + i + 1, argv + argc);
            break;
        }

        std::cerr << "Unknown argument: " << argv[i] << "\n";
        print_usage(argv[0]);
        return 2;
    }

    toolbridge::BridgeConfig cfg;
    try {
        if (!config_path.empty()) cfg = toolbridge::BridgeConfig::load_file(config_path);
    } catch (const toolbridge::ConfigError& e) {
        std::cerr << "toolbridge: " << e.what() << std::endl;
        return 2;
    }
    cfg.apply_environment();
    if (!log_level.empty()) cfg.logging.level = log_level;
    if (!worker_cmd.empty()) {
        cfg.worker.worker.command = worker_cmd.front();
        cfg.worker.worker.args.assign(worker_cmd.begin() + 1, worker_cmd.end());
    }

    toolbridge::logging::init(cfg.logging.properties_file, cfg.logging.level);
    auto& log = toolbridge::logging::core();

    LOG4CPLUS_INFO(log, "toolbridge " << toolbridge::LIBRARY_VERSION << " starting");
    if (cfg.worker.worker.command.empty()) {
        LOG4CPLUS_WARN(log, "No worker command configured; worker-backed tools will fail");
    } else {
        LOG4CPLUS_INFO(log, "Worker: " << cfg.worker.worker.command);
    }

    // Signals are taken synchronously by one thread; every thread started
    // after this point inherits the mask.
    sigset_t blocked;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &blocked, nullptr);

    int exit_code = 0;
    try {
        auto worker = std::make_shared<toolbridge::WorkerClient>(cfg.worker);
        toolbridge::BridgeServer server(cfg.server);
        server.attach_worker(worker);
        for (auto& tool : cfg.tools) {
            server.add_worker_tool(tool.definition, tool.worker_method, tool.timeout);
        }
        LOG4CPLUS_INFO(log, "Registered " << cfg.tools.size() << " tool(s)");

        // Stopped and joined on every exit from this scope.
        toolbridge::SignalWatcher signals({SIGINT, SIGTERM}, [&server, &log](int sig) {
            LOG4CPLUS_INFO(log, "Received " << strsignal(sig) << ", shutting down");
            server.shutdown();
        });

        server.serve_stdio();

        signals.stop();
        server.shutdown();
    } catch (const toolbridge::BridgeError& e) {
        LOG4CPLUS_FATAL(log, e.what());
        exit_code = 1;
    }

    LOG4CPLUS_INFO(log, "toolbridge stopped");
    return exit_code;
}
