#include "driftwatch/application.hpp"
#include <iostream>
#include <csignal>
#include <memory>
#include <string>
#include <vector>

// Global pointer for signal handler
driftwatch::Application* g_app = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_app) {
            g_app->stop();
        }
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [-c config_file] <command> [args]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  run                  Monitor the project until interrupted (default)\n";
    std::cout << "  check <file>         Check one file against its specification\n";
    std::cout << "  alerts [--all]       List open alerts, or every alert with --all\n";
    std::cout << "  resolve <id> [note]  Mark an alert as resolved\n";
    std::cout << "  summary              Show alert statistics\n";
    std::cout << "  suggest <id>         Show realignment suggestions for an alert\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE    Path to YAML configuration file (default: config/default_config.yaml)\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "\n";
}

static bool parse_id(const std::string& text, int64_t& id) {
    try {
        size_t used = 0;
        id = std::stoll(text, &used);
        return used == text.size() && id > 0;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    // Parse command-line arguments
    std::string config_path = "config/default_config.yaml";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a file argument\n";
                return 1;
            }
            config_path = argv[++i];
            continue;
        }
        args.push_back(arg);
    }

    std::string command = args.empty() ? "run" : args[0];

    // Delivery failures surface as channel results, not signals
    std::signal(SIGPIPE, SIG_IGN);

    auto app = std::make_unique<driftwatch::Application>(config_path);
    if (!app->initialize()) {
        std::cerr << "Failed to initialize driftwatch\n";
        return 1;
    }

    if (command == "run") {
        // Setup signal handlers
        g_app = app.get();
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        int rc = app->run();
        std::cout << "driftwatch stopped.\n";
        return rc;
    }
    if (command == "check" && args.size() == 2) {
        return app->check(args[1]);
    }
    if (command == "alerts" && args.size() <= 2) {
        bool all = args.size() == 2 && args[1] == "--all";
        if (args.size() == 2 && !all) {
            print_usage(argv[0]);
            return 1;
        }
        return app->list_alerts(all);
    }
    if (command == "summary" && args.size() == 1) {
        return app->summary();
    }

    int64_t id = 0;
    if (command == "resolve" && (args.size() == 2 || args.size() == 3) && parse_id(args[1], id)) {
        return app->resolve(id, args.size() == 3 ? args[2] : std::string());
    }
    if (command == "suggest" && args.size() == 2 && parse_id(args[1], id)) {
        return app->suggest(id);
    }

    print_usage(argv[0]);
    return 1;
}
