#pragma once

#include "enums/ContractStatus.hpp"
#include "enums/ContractType.hpp"
#include "Money.hpp"
#include "Percent.hpp"
#include "Signature.hpp"
#include "ScheduledInstallment.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>

namespace realty::domain {

/**
 * @brief Договор купли-продажи или аренды
 *
 * Агрегат: договор владеет упорядоченным графиком взносов.
 * Инвариант: downpaymentAmount + equityAmount + loanableAmount == totalAmount.
 */
struct Contract {
    std::string id;
    std::string contractNumber;
    ContractType type = ContractType::PURCHASE_AGREEMENT;
    std::string propertyId;

    std::string clientId;                   ///< Покупатель / арендатор
    std::string developerId;                ///< Застройщик / собственник
    std::optional<std::string> agentId;
    std::optional<std::string> brokerId;

    // Финансовые условия
    Money totalAmount;
    Money reservationFee;
    Money downpaymentAmount;
    Money equityAmount;
    Money loanableAmount;
    Money monthlyPayment;                   ///< Справочно, пересчитывается при построении графика

    int downpaymentMonths = 1;
    int equityMonths = 1;
    int termMonths = 0;                     ///< Срок погашения кредитной части
    bool allowPrepayment = false;

    Timestamp startDate;
    std::optional<Timestamp> endDate;

    ContractStatus status = ContractStatus::DRAFT;

    std::optional<Percent> commissionRateAgent;
    std::optional<Percent> commissionRateBroker;

    ContractSignatures signatures;

    std::vector<ScheduledInstallment> installments;

    Money ledgerBalance;                    ///< Баланс леджера (основной долг за вычетом возвратов)

    int64_t version = 0;                    ///< Для оптимистической блокировки
    std::string cancellationReason;
    Timestamp createdAt;
    Timestamp updatedAt;

    const std::string& currency() const {
        return totalAmount.currency;
    }

    bool hasSchedule() const {
        return !installments.empty();
    }

    /**
     * @brief Найти взнос по номеру
     */
    ScheduledInstallment* findInstallment(int number) {
        for (auto& installment : installments) {
            if (installment.installmentNumber == number) {
                return &installment;
            }
        }
        return nullptr;
    }
};

} // namespace realty::domain
