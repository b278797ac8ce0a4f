#pragma once

#include <string>

namespace realty::ports::output {

/**
 * @brief Интерфейс для публикации событий леджера
 *
 * Реализуется LoggingEventPublisher; в тестах - MockEventPublisher.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "ledger.payment.applied")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace realty::ports::output
