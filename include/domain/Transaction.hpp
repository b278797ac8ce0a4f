#pragma once

#include "enums/TransactionType.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>

namespace realty::domain {

/**
 * @brief Распределение платежа на один взнос
 */
struct InstallmentAllocation {
    int installmentNumber = 0;
    Money principal;    ///< Зачтено в основной долг
    Money penalty;      ///< Зачтено в пени
};

/**
 * @brief Проводка леджера (append-only)
 *
 * balanceAfter = balanceBefore + signedAmount(). Проводки не изменяются и
 * не удаляются - только компенсируются новыми проводками REVERSAL.
 * Связь сторно направлена только от REVERSAL к оригиналу.
 */
struct Transaction {
    std::string id;
    std::string contractId;
    TransactionType type = TransactionType::PAYMENT;
    Money amount;
    Money balanceBefore;
    Money balanceAfter;

    std::optional<std::string> reversedTransactionId;
    std::optional<TransactionType> reversedType;    ///< Тип сторнированной проводки

    std::vector<InstallmentAllocation> allocations; ///< Для PAYMENT, PENALTY и их сторно
    std::optional<std::string> commissionRecordId;  ///< Для COMMISSION_PAYOUT

    std::string externalReference;
    std::string reason;
    Timestamp createdAt;

    /**
     * @brief Влияние проводки на баланс договора
     *
     * PAYMENT: +amount; REFUND: -amount; PENALTY и COMMISSION_PAYOUT: 0
     * (баланс ведёт только основной долг); REVERSAL: противоположно оригиналу.
     */
    Money signedAmount() const {
        return signedAmount(type, amount, reversedType);
    }

    static Money signedAmount(TransactionType type, const Money& amount,
                              std::optional<TransactionType> reversedType = std::nullopt) {
        switch (type) {
            case TransactionType::PAYMENT:
                return amount;
            case TransactionType::REFUND:
                return amount.negate();
            case TransactionType::PENALTY:
            case TransactionType::COMMISSION_PAYOUT:
                return Money::zero(amount.currency);
            case TransactionType::REVERSAL:
                // amount уже равен -original.amount
                if (reversedType) {
                    return signedAmount(*reversedType, amount.negate()).negate();
                }
                return Money::zero(amount.currency);
        }
        return Money::zero(amount.currency);
    }

    bool isReversal() const {
        return type == TransactionType::REVERSAL;
    }

    Money principalAllocated() const {
        Money total = Money::zero(amount.currency);
        for (const auto& a : allocations) {
            total += a.principal;
        }
        return total;
    }

    Money penaltyAllocated() const {
        Money total = Money::zero(amount.currency);
        for (const auto& a : allocations) {
            total += a.penalty;
        }
        return total;
    }
};

} // namespace realty::domain
