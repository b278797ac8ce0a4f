#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <iostream>
#include <mutex>

namespace realty::adapters::secondary {

/**
 * @brief Публикация событий в stdout
 *
 * Одна строка на событие: "[event] <routingKey> <json>". Брокер сообщений
 * подключается на месте этого адаптера через тот же порт.
 */
class LoggingEventPublisher : public ports::output::IEventPublisher {
public:
    LoggingEventPublisher() {
        std::cout << "[LoggingEventPublisher] Created" << std::endl;
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[event] " << routingKey << " " << message << std::endl;
    }

private:
    std::mutex mutex_;
};

} // namespace realty::adapters::secondary
