// include/LedgerApp.hpp
#pragma once

#include <boost/di.hpp>

// Ports
#include "ports/input/ILedgerService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/ILedgerStore.hpp"

// Settings
#include "settings/LedgerSettings.hpp"

// Application
#include "application/LedgerService.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "adapters/secondary/LoggingEventPublisher.hpp"
#include "adapters/secondary/SystemClock.hpp"

// Primary Adapters
#include "adapters/primary/LedgerCommandHandler.hpp"

#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace di = boost::di;

namespace realty {

/**
 * @brief Realty Ledger Application
 *
 * Читает команды JSON Lines (одна команда на строку) из файла argv[1]
 * или из stdin и печатает ответ на каждую строку.
 * События леджера публикуются в stdout строками "[event] ...".
 */
class LedgerApp {
public:
    LedgerApp() { std::cout << "[LedgerApp] Initializing..." << std::endl; }
    ~LedgerApp() { std::cout << "[LedgerApp] Shutting down..." << std::endl; }

    /**
     * @brief Template Method: loadEnvironment() -> configureInjection() -> start()
     * @return Количество команд, завершившихся ошибкой
     */
    int run(int argc, char* argv[]) {
        loadEnvironment(argc, argv);
        configureInjection();
        return start();
    }

    void stop() {
        running_ = 0;
    }

protected:
    void loadEnvironment(int argc, char* argv[]) {
        if (argc > 1) {
            scriptPath_ = argv[1];
        }
        std::cout << "[LedgerApp] Environment loaded, input="
                  << (scriptPath_.empty() ? "stdin" : scriptPath_) << std::endl;
    }

    void configureInjection() {
        std::cout << "[LedgerApp] Configuring DI..." << std::endl;

        auto injector = di::make_injector(
            di::bind<settings::ILedgerSettings>().to<settings::LedgerSettings>().in(di::singleton),

            di::bind<ports::output::ILedgerStore>().to<adapters::secondary::InMemoryLedgerStore>().in(di::singleton),
            di::bind<ports::output::IEventPublisher>().to<adapters::secondary::LoggingEventPublisher>().in(di::singleton),
            di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),

            di::bind<ports::input::ILedgerService>().to<application::LedgerService>().in(di::singleton)
        );

        commandHandler_ = injector.create<std::shared_ptr<adapters::primary::LedgerCommandHandler>>();

        std::cout << "[LedgerApp] Ready" << std::endl;
    }

    int start() {
        std::ifstream file;
        if (!scriptPath_.empty()) {
            file.open(scriptPath_);
            if (!file) {
                throw std::runtime_error("Cannot open command script: " + scriptPath_);
            }
        }
        std::istream& input = scriptPath_.empty() ? std::cin : file;

        int failures = 0;
        std::string line;
        size_t lineNumber = 0;
        while (running_ && std::getline(input, line)) {
            ++lineNumber;
            if (line.empty() || line[0] == '#') {
                continue;
            }
            std::string response = commandHandler_->handle(line);
            if (nlohmann::json::parse(response).value("status", "") != "ok") {
                ++failures;
            }
            std::cout << response << std::endl;
        }

        std::cout << "[LedgerApp] Processed " << lineNumber << " line(s), " << failures << " failed" << std::endl;
        return failures;
    }

private:
    std::string scriptPath_;
    std::shared_ptr<adapters::primary::LedgerCommandHandler> commandHandler_;
    volatile std::sig_atomic_t running_ = 1;
};

} // namespace realty
