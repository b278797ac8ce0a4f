#pragma once

#include "Contract.hpp"
#include "CommissionRecord.hpp"
#include <vector>

namespace realty::domain {

/**
 * @brief Прогресс оплаты договора
 */
struct PaymentProgress {
    Money totalAmount;
    Money totalPaid;
    Money remaining;
    int64_t progressBasisPoints = 0;    ///< 10000 = 100%
};

/**
 * @brief Вычисляемые свойства договора
 *
 * Чистые функции над моделью данных вместо вычисляемых полей ORM.
 */
namespace progress {

inline bool isActive(const Contract& contract) {
    return contract.status == ContractStatus::ACTIVE;
}

/**
 * @brief Подписан ли договор всеми обязательными сторонами
 *
 * Клиент и застройщик - всегда, агент - только если назначен.
 */
inline bool isFullySigned(const Contract& contract) {
    bool signedByParties = contract.signatures.client.isSigned && contract.signatures.landlord.isSigned;
    if (contract.agentId) {
        signedByParties = signedByParties && contract.signatures.agent.isSigned;
    }
    return signedByParties;
}

/**
 * @brief Погашенный основной долг по всем взносам (без пени)
 */
inline Money principalPaid(const Contract& contract) {
    Money total = Money::zero(contract.currency());
    for (const auto& installment : contract.installments) {
        total += installment.paidAmount;
    }
    return total;
}

/**
 * @brief Погашенный основной долг только по плановым взносам
 */
inline Money scheduledPrincipalPaid(const Contract& contract) {
    Money total = Money::zero(contract.currency());
    for (const auto& installment : contract.installments) {
        if (!installment.unscheduled) {
            total += installment.paidAmount;
        }
    }
    return total;
}

inline Money outstandingPrincipal(const Contract& contract) {
    Money total = Money::zero(contract.currency());
    for (const auto& installment : contract.installments) {
        total += installment.outstandingPrincipal();
    }
    return total;
}

inline Money outstandingPenalty(const Contract& contract) {
    Money total = Money::zero(contract.currency());
    for (const auto& installment : contract.installments) {
        total += installment.outstandingPenalty();
    }
    return total;
}

/**
 * @brief Весь плановый основной долг выплачен
 */
inline bool isFullyPaid(const Contract& contract) {
    return contract.hasSchedule() && scheduledPrincipalPaid(contract) == contract.totalAmount;
}

inline PaymentProgress paymentProgress(const Contract& contract) {
    PaymentProgress result;
    result.totalAmount = contract.totalAmount;
    result.totalPaid = principalPaid(contract);
    result.remaining = contract.totalAmount - scheduledPrincipalPaid(contract);
    if (contract.totalAmount.isPositive()) {
        result.progressBasisPoints = result.totalPaid.amount * 10000 / contract.totalAmount.amount;
    }
    return result;
}

inline std::vector<ScheduledInstallment> overdueInstallments(const Contract& contract) {
    std::vector<ScheduledInstallment> result;
    for (const auto& installment : contract.installments) {
        if (installment.isOverdue && !installment.isSettled()) {
            result.push_back(installment);
        }
    }
    return result;
}

/**
 * @brief Сумма комиссий по всем записям (выплаченным и нет)
 */
inline Money totalCommission(const std::vector<CommissionRecord>& records, const std::string& currency) {
    Money total = Money::zero(currency);
    for (const auto& record : records) {
        total += record.computedAmount;
    }
    return total;
}

} // namespace progress

} // namespace realty::domain
