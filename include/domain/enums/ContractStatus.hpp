#pragma once

#include <string>
#include <stdexcept>

namespace realty::domain {

/**
 * @brief Статус договора
 *
 * DRAFT -> PENDING_SIGNATURE -> ACTIVE -> {COMPLETED, TERMINATED, CANCELLED, EXPIRED}
 */
enum class ContractStatus {
    DRAFT,              ///< Черновик, график ещё не построен
    PENDING_SIGNATURE,  ///< График построен, ожидаются подписи
    ACTIVE,             ///< Подписан, принимает платежи
    COMPLETED,          ///< Основной долг выплачен полностью
    TERMINATED,         ///< Расторгнут
    CANCELLED,          ///< Отменён
    EXPIRED             ///< Истёк срок действия
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(ContractStatus status) {
    switch (status) {
        case ContractStatus::DRAFT:             return "DRAFT";
        case ContractStatus::PENDING_SIGNATURE: return "PENDING_SIGNATURE";
        case ContractStatus::ACTIVE:            return "ACTIVE";
        case ContractStatus::COMPLETED:         return "COMPLETED";
        case ContractStatus::TERMINATED:        return "TERMINATED";
        case ContractStatus::CANCELLED:         return "CANCELLED";
        case ContractStatus::EXPIRED:           return "EXPIRED";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline ContractStatus contractStatusFromString(const std::string& str) {
    if (str == "DRAFT")             return ContractStatus::DRAFT;
    if (str == "PENDING_SIGNATURE") return ContractStatus::PENDING_SIGNATURE;
    if (str == "ACTIVE")            return ContractStatus::ACTIVE;
    if (str == "COMPLETED")         return ContractStatus::COMPLETED;
    if (str == "TERMINATED")        return ContractStatus::TERMINATED;
    if (str == "CANCELLED")         return ContractStatus::CANCELLED;
    if (str == "EXPIRED")           return ContractStatus::EXPIRED;
    throw std::invalid_argument("Unknown ContractStatus: " + str);
}

/**
 * @brief Является ли статус финальным (договор больше не может измениться)
 */
inline bool isTerminalStatus(ContractStatus status) {
    return status == ContractStatus::COMPLETED ||
           status == ContractStatus::TERMINATED ||
           status == ContractStatus::CANCELLED ||
           status == ContractStatus::EXPIRED;
}

} // namespace realty::domain
