#pragma once

#include "domain/Contract.hpp"
#include "domain/CommissionRecord.hpp"
#include "domain/LedgerPolicy.hpp"
#include "domain/PaymentRecord.hpp"
#include "domain/Transaction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace realty::application {

/**
 * @brief Результат зачёта платежа
 */
struct PaymentOutcome {
    domain::Transaction payment;                ///< Проводка PAYMENT (основной долг)
    std::vector<domain::Transaction> penalties; ///< Пени, начисленные перед зачётом
};

/**
 * @brief Движок леджера
 *
 * Зачитывает платежи по графику (от старых взносов к новым, пени раньше
 * основного долга), начисляет пени, ведёт баланс договора и создаёт
 * проводки. Владеет протоколом сторно.
 *
 * Движок не хранит состояние и не выполняет ввод-вывод: каждая операция
 * работает над копией договора и подменяет его только при успехе, поэтому
 * при исключении переданный договор не меняется.
 */
class LedgerEngine {
public:
    /**
     * @throws ConfigurationError если политика некорректна
     */
    explicit LedgerEngine(domain::LedgerPolicy policy);

    /**
     * @brief Зачесть платёж
     *
     * @param contract Договор с загруженным графиком (изменяется при успехе)
     * @param record Входящий платёж
     * @return Проводка PAYMENT и начисленные пени
     *
     * @throws ContractNotPayableError если договор не ACTIVE
     * @throws CurrencyMismatch если валюта платежа отличается от валюты договора
     * @throws OverpaymentError если платёж больше остатка и предоплата не разрешена
     * @throws ConfigurationError если требуется пеня, а ставка не задана
     */
    PaymentOutcome applyPayment(domain::Contract& contract, const domain::PaymentRecord& record) const;

    /**
     * @brief Сторнировать проводку
     *
     * @param contract Договор проводки (изменяется при успехе)
     * @param original Сторнируемая проводка
     * @param existingReversalId ID уже существующего сторно (из уникального индекса хранилища)
     * @param reason Причина сторно
     * @param at Время сторно
     * @return Проводка REVERSAL с amount = -original.amount
     *
     * @throws InvalidReversalError для REVERSAL, чужого договора или PAYMENT вне ACTIVE
     * @throws AlreadyReversedError если existingReversalId задан
     */
    domain::Transaction reverseTransaction(
        domain::Contract& contract,
        const domain::Transaction& original,
        const std::optional<std::string>& existingReversalId,
        const std::string& reason,
        const domain::Timestamp& at
    ) const;

    /**
     * @brief Начислить пени по всем просроченным взносам на дату asOf
     * @return Проводки PENALTY (могут быть пустыми)
     * @throws ContractNotPayableError если договор не ACTIVE
     * @throws ConfigurationError если ставка пени не задана
     */
    std::vector<domain::Transaction> assessPenalties(domain::Contract& contract, const domain::Timestamp& asOf) const;

    /**
     * @brief Возврат средств клиенту по отменённому/расторгнутому договору
     *
     * @throws ContractNotPayableError если договор не CANCELLED/TERMINATED
     * @throws OverpaymentError если сумма больше баланса договора
     */
    domain::Transaction refund(
        domain::Contract& contract,
        const domain::Money& amount,
        const std::string& reason,
        const domain::Timestamp& at
    ) const;

    /**
     * @brief Проводка выплаты комиссии (баланс договора не меняется)
     *
     * @throws AlreadyPaidError если запись уже выплачена
     */
    domain::Transaction recordCommissionPayout(
        const domain::Contract& contract,
        const domain::CommissionRecord& record,
        const domain::Timestamp& at
    ) const;

    const domain::LedgerPolicy& policy() const { return policy_; }

private:
    domain::LedgerPolicy policy_;

    std::vector<domain::Transaction> assessPenaltiesOn(domain::Contract& working, const domain::Timestamp& asOf) const;

    void unwindAllocations(domain::Contract& working, const domain::Transaction& original,
                           const domain::Timestamp& at) const;

    void waivePenalty(domain::Contract& working, const domain::Transaction& original) const;

    domain::Transaction makeTransaction(const domain::Contract& working, domain::TransactionType type,
                                        const domain::Money& amount, const domain::Timestamp& at) const;
};

} // namespace realty::application
