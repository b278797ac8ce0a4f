#include "LedgerApp.hpp"
#include <iostream>
#include <csignal>

// Global pointer for signal handler
realty::LedgerApp* g_app = nullptr;

void signalHandler(int signal) {
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        realty::LedgerApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Realty Ledger v1.0.0 Starting" << std::endl;
        std::cout << "  Usage: realty_ledger [commands.jsonl]" << std::endl;
        std::cout << "========================================" << std::endl;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        int failures = app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Realty Ledger stopped" << std::endl;
        return failures == 0 ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
