// ============================================================
// server/main.cpp -- tws entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "options.hpp"
#include "server_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>

int main(int argc, char* argv[]) {
    platform::init();

    if (const char* log_file = std::getenv("TWS_LOG_FILE")) {
        if (!Logger::get().set_log_file(log_file)) {
            LOG_WARN(std::string("Cannot open log file ") + log_file);
        }
    }

    std::string prog = utils::basename(argc > 0 ? argv[0] : "tws");

    ServerConfig cfg;
    try {
        cfg = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n\n";
        print_usage(std::cerr, prog, true);
        return 1;
    }

    if (cfg.show_help) {
        print_usage(std::cerr, prog, false);
        return 1;
    }

    if (cfg.verbose) {
        Logger::get().set_level(LogLevel::DEBUG);
    }

    try {
        ServerApp app(std::move(cfg));
        return app.run();
    } catch (const SetupError& e) {
        LOG_ERROR(e.what());
    } catch (const ProtocolError& e) {
        LOG_ERROR(e.what());
    } catch (const TransportError& e) {
        std::cout << "\n";  // keep the last progress line
        LOG_ERROR(e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("FATAL: ") + e.what());
    }
    return 1;
}
