#pragma once

#include "DomainEvent.hpp"
#include "domain/Transaction.hpp"
#include <string>

namespace realty::domain {

/**
 * @brief Событие: в леджер записана проводка
 *
 * Тип события зависит от типа проводки:
 * - PAYMENT → ledger.payment.applied
 * - PENALTY → ledger.penalty.assessed
 * - REVERSAL → ledger.transaction.reversed
 * - REFUND → ledger.refund.issued
 * - COMMISSION_PAYOUT → commission.paid
 */
struct LedgerTransactionEvent : public DomainEvent {
    Transaction transaction;

    explicit LedgerTransactionEvent(const Transaction& entry)
        : DomainEvent(routingKeyFor(entry.type), entry.createdAt)
        , transaction(entry) {}

    static std::string routingKeyFor(TransactionType type) {
        switch (type) {
            case TransactionType::PAYMENT:           return "ledger.payment.applied";
            case TransactionType::PENALTY:           return "ledger.penalty.assessed";
            case TransactionType::REVERSAL:          return "ledger.transaction.reversed";
            case TransactionType::REFUND:            return "ledger.refund.issued";
            case TransactionType::COMMISSION_PAYOUT: return "commission.paid";
        }
        return "ledger.transaction";
    }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<LedgerTransactionEvent>(*this);
    }
};

} // namespace realty::domain
