#pragma once

#include "domain/Contract.hpp"
#include "domain/CommissionRecord.hpp"
#include "domain/LedgerPolicy.hpp"
#include "domain/Transaction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace realty::application {

/**
 * @brief Начисление комиссий агенту и брокеру
 *
 * Комиссия считается только с основного долга зачтённого платежа, пени в
 * базу не входят. На каждую роль по договору открыта не более чем одна
 * невыплаченная запись; выплаченные записи не изменяются.
 */
class CommissionCalculator {
public:
    explicit CommissionCalculator(domain::LedgerPolicy policy);

    /**
     * @brief Начислить комиссии по зачтённому платежу
     *
     * @param contract Договор платежа
     * @param payment Проводка PAYMENT
     * @param records Все записи комиссий договора
     * @param at Время начисления
     * @return Созданные или изменённые записи (для сохранения)
     *
     * @throws ConfigurationError если получатель назначен, а ставка не задана ни в договоре, ни в политике
     */
    std::vector<domain::CommissionRecord> onPaymentRecognized(
        const domain::Contract& contract,
        const domain::Transaction& payment,
        const std::vector<domain::CommissionRecord>& records,
        const domain::Timestamp& at
    ) const;

    /**
     * @brief Откатить комиссии при сторно платежа
     *
     * Начисление с отрицательной базой: сумма комиссии уменьшается ровно на
     * то, что было начислено с исходного платежа. Если открытой записи нет
     * (всё выплачено), создаётся новая запись с отрицательной суммой (удержание).
     */
    std::vector<domain::CommissionRecord> onPaymentReversed(
        const domain::Contract& contract,
        const domain::Transaction& reversal,
        const std::vector<domain::CommissionRecord>& records,
        const domain::Timestamp& at
    ) const;

    /**
     * @brief Вернуть в начисленные сумму сторнированной выплаты
     *
     * Выплаченная запись остаётся как есть, сумма переходит в открытую запись роли.
     *
     * @param paidRecord Запись, выплату которой сторнировали
     */
    domain::CommissionRecord onPayoutReversed(
        const domain::CommissionRecord& paidRecord,
        const std::vector<domain::CommissionRecord>& records,
        const domain::Timestamp& at
    ) const;

    /**
     * @brief Отметить запись выплаченной
     * @throws AlreadyPaidError если выплата уже зафиксирована
     */
    domain::CommissionRecord markPaid(
        const domain::CommissionRecord& record,
        const std::string& payoutTransactionId,
        const domain::Timestamp& at
    ) const;

    /**
     * @brief Действующая ставка роли: ставка договора, иначе ставка политики
     * @return nullopt если получатель роли не назначен
     * @throws ConfigurationError если получатель назначен, а ставка не задана нигде
     */
    std::optional<domain::Percent> effectiveRate(const domain::Contract& contract, domain::CommissionRole role) const;

private:
    domain::LedgerPolicy policy_;

    std::vector<domain::CommissionRecord> accrue(
        const domain::Contract& contract,
        const domain::Money& base,
        const std::vector<domain::CommissionRecord>& records,
        const domain::Timestamp& at
    ) const;
};

} // namespace realty::application
