#pragma once

#include "domain/Timestamp.hpp"
#include "utils/UuidGenerator.hpp"
#include <string>
#include <memory>

namespace realty::domain {

/**
 * @brief Базовый класс для всех доменных событий леджера
 *
 * eventType совпадает с ключом маршрутизации, под которым событие публикуется.
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (ledger.payment.applied, commission.paid)
    Timestamp timestamp;        ///< Время создания события

    DomainEvent() : eventId(utils::UuidGenerator::generate()), timestamp(Timestamp::now()) {}

    DomainEvent(const std::string& type, const Timestamp& at)
        : eventId(utils::UuidGenerator::generate()), eventType(type), timestamp(at) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    /**
     * @brief Клонировать событие
     */
    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

} // namespace realty::domain
