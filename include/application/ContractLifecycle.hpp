#pragma once

#include "domain/Contract.hpp"
#include "domain/enums/SignatureParty.hpp"
#include <string>

namespace realty::application {

/**
 * @brief Машина состояний договора
 *
 * ```
 * DRAFT -> PENDING_SIGNATURE -> ACTIVE -> COMPLETED | EXPIRED
 *   \_____________\______________\____-> TERMINATED | CANCELLED
 * ```
 *
 * Переходы через ступень запрещены. Финальные статусы не допускают
 * никаких переходов. Каждый метод меняет договор только при успехе.
 */
class ContractLifecycle {
public:
    /**
     * @brief Разрешён ли переход (без проверки условий)
     */
    static bool canTransition(domain::ContractStatus from, domain::ContractStatus to);

    /**
     * @brief DRAFT -> PENDING_SIGNATURE
     * @throws InvalidTransitionError если график не построен или статус не DRAFT
     */
    void submitForSignature(domain::Contract& contract, const domain::Timestamp& at) const;

    /**
     * @brief Зафиксировать подпись стороны
     *
     * Подписывать можно в DRAFT и PENDING_SIGNATURE. Если договор в
     * PENDING_SIGNATURE и подписан всеми обязательными сторонами, он
     * активируется автоматически.
     *
     * @return true если договор стал ACTIVE
     * @throws InvalidTransitionError если статус не допускает подписи или агент не назначен
     */
    bool recordSignature(
        domain::Contract& contract,
        domain::SignatureParty party,
        const std::string& blob,
        const domain::Timestamp& at
    ) const;

    /**
     * @brief PENDING_SIGNATURE -> ACTIVE
     * @throws InvalidTransitionError если договор подписан не всеми сторонами
     */
    void activate(domain::Contract& contract, const domain::Timestamp& at) const;

    /**
     * @brief ACTIVE -> COMPLETED, если весь плановый основной долг выплачен
     * @return true если переход выполнен
     */
    bool completeIfPaid(domain::Contract& contract, const domain::Timestamp& at) const;

    /**
     * @brief ACTIVE -> EXPIRED, если now позже endDate
     * @return true если переход выполнен
     */
    bool expireIfDue(domain::Contract& contract, const domain::Timestamp& now) const;

    /**
     * @brief Расторжение
     * @throws InvalidTransitionError из финального статуса
     */
    void terminate(domain::Contract& contract, const std::string& reason, const domain::Timestamp& at) const;

    /**
     * @brief Отмена
     * @throws InvalidTransitionError из финального статуса
     */
    void cancel(domain::Contract& contract, const std::string& reason, const domain::Timestamp& at) const;

private:
    void transition(domain::Contract& contract, domain::ContractStatus to, const domain::Timestamp& at) const;
};

} // namespace realty::application
