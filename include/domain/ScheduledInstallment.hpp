#pragma once

#include "enums/PaymentType.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>

namespace realty::domain {

/**
 * @brief Одно плановое обязательство по графику платежей
 *
 * Создаётся PaymentScheduleBuilder, изменяется только LedgerEngine.
 * paidAmount учитывает только основной долг, пени ведутся отдельно.
 */
struct ScheduledInstallment {
    std::string contractId;
    int installmentNumber = 0;          ///< 1..N, уникален в пределах договора
    Money amount;                       ///< Основной долг по взносу
    Timestamp dueDate;
    PaymentType paymentType = PaymentType::MONTHLY_AMORTIZATION;

    Money paidAmount;                   ///< Погашенный основной долг
    std::optional<Timestamp> paidDate;  ///< Дата полного погашения

    bool isOverdue = false;
    int64_t daysOverdue = 0;
    Money penaltyAmount;                ///< Начисленные пени (нарастающим итогом)
    Money penaltyPaid;                  ///< Уплаченные пени
    int64_t penaltyPeriodsAssessed = 0; ///< Сколько 30-дневных периодов уже начислено

    bool unscheduled = false;           ///< Добавлен предоплатой сверх графика

    Money outstandingPrincipal() const {
        return amount - paidAmount;
    }

    Money outstandingPenalty() const {
        return penaltyAmount - penaltyPaid;
    }

    bool isSettled() const {
        return paidAmount == amount;
    }
};

} // namespace realty::domain
