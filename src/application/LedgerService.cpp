#include "application/LedgerService.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/events/CommissionAccruedEvent.hpp"
#include "domain/events/ConstructionMilestoneEvent.hpp"
#include "domain/events/ContractStatusChangedEvent.hpp"
#include "domain/events/LedgerTransactionEvent.hpp"
#include "utils/UuidGenerator.hpp"
#include <iostream>
#include <stdexcept>

namespace realty::application {

using domain::CommissionRecord;
using domain::Contract;
using domain::ContractStatus;
using domain::Money;
using domain::Timestamp;
using domain::Transaction;
using ports::output::LedgerChangeSet;

LedgerService::LedgerService(
    std::shared_ptr<ports::output::ILedgerStore> store,
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
    std::shared_ptr<ports::output::IClock> clock,
    std::shared_ptr<settings::ILedgerSettings> settings
) : store_(std::move(store))
  , eventPublisher_(std::move(eventPublisher))
  , clock_(std::move(clock))
  , engine_(settings->getPolicy())
  , commissions_(settings->getPolicy())
{
    std::cout << "[LedgerService] Created, currency=" << engine_.policy().currency << std::endl;
}

// ============================================================================
// CONTRACT
// ============================================================================

void LedgerService::registerProperty(const domain::Property& property) {
    if (property.id.empty()) {
        throw std::invalid_argument("Property id is required");
    }
    store_->saveProperty(property);
    std::cout << "[LedgerService] Registered property " << property.id << std::endl;
}

Contract LedgerService::registerContract(const Contract& contract) {
    Contract draft = contract;
    if (draft.id.empty()) {
        draft.id = utils::UuidGenerator::contractId();
    }
    if (draft.currency() != engine_.policy().currency) {
        throw domain::CurrencyMismatch("Contract " + draft.id + " is in " + draft.currency() +
                                       ", ledger currency is " + engine_.policy().currency);
    }
    scheduleBuilder_.validate(draft);
    loadProperty(draft.propertyId);

    Timestamp now = clock_->now();
    draft.status = ContractStatus::DRAFT;
    draft.installments.clear();
    draft.signatures = domain::ContractSignatures{};
    draft.ledgerBalance = Money::zero(draft.currency());
    draft.monthlyPayment = Money::zero(draft.currency());
    draft.createdAt = now;
    draft.updatedAt = now;

    if (!store_->createContract(draft)) {
        throw std::invalid_argument("Contract already exists: " + draft.id);
    }

    std::cout << "[LedgerService] Registered contract " << draft.id
              << " total=" << draft.totalAmount.toString() << std::endl;
    return loadContract(draft.id);
}

template <typename Mutation>
Contract LedgerService::mutateContract(const std::string& contractId, Mutation mutation) {
    auto lock = locks_.acquire(contractId);
    Contract before = loadContract(contractId);
    Contract after = before;
    std::string reason = mutation(after, clock_->now());

    LedgerChangeSet changes;
    changes.contract = after;
    changes.expectedVersion = before.version;
    return commitAndPublish(before, std::move(changes), {}, reason);
}

Contract LedgerService::prepareSchedule(const std::string& contractId) {
    return mutateContract(contractId, [this](Contract& contract, const Timestamp& now) {
        contract.installments = scheduleBuilder_.build(contract);
        contract.monthlyPayment = Money::zero(contract.currency());
        for (const auto& installment : contract.installments) {
            if (installment.paymentType == domain::PaymentType::MONTHLY_AMORTIZATION) {
                contract.monthlyPayment = installment.amount;
                break;
            }
        }
        lifecycle_.submitForSignature(contract, now);

        // Подписи, собранные ещё в DRAFT, активируют договор сразу
        if (domain::progress::isFullySigned(contract)) {
            lifecycle_.activate(contract, now);
        }
        std::cout << "[LedgerService] Built schedule for " << contract.id << ": "
                  << contract.installments.size() << " installments" << std::endl;
        return std::string("Schedule built");
    });
}

Contract LedgerService::recordSignature(
    const std::string& contractId,
    domain::SignatureParty party,
    const std::string& blob
) {
    return mutateContract(contractId, [this, party, &blob](Contract& contract, const Timestamp& now) {
        bool activated = lifecycle_.recordSignature(contract, party, blob, now);
        std::cout << "[LedgerService] " << domain::toString(party) << " signed " << contract.id
                  << (activated ? " (activated)" : "") << std::endl;
        return std::string("Signed by ") + domain::toString(party);
    });
}

Contract LedgerService::activate(const std::string& contractId) {
    return mutateContract(contractId, [this](Contract& contract, const Timestamp& now) {
        lifecycle_.activate(contract, now);
        return std::string("Activated");
    });
}

Contract LedgerService::terminate(const std::string& contractId, const std::string& reason) {
    return mutateContract(contractId, [this, &reason](Contract& contract, const Timestamp& now) {
        lifecycle_.terminate(contract, reason, now);
        return reason;
    });
}

Contract LedgerService::cancel(const std::string& contractId, const std::string& reason) {
    return mutateContract(contractId, [this, &reason](Contract& contract, const Timestamp& now) {
        lifecycle_.cancel(contract, reason, now);
        return reason;
    });
}

std::vector<std::string> LedgerService::expireContracts() {
    std::vector<std::string> expired;
    Timestamp now = clock_->now();

    for (const auto& candidate : store_->findContractsByStatus(ContractStatus::ACTIVE)) {
        if (!candidate.endDate || !(now > *candidate.endDate)) {
            continue;
        }

        auto lock = locks_.acquire(candidate.id);
        Contract before = loadContract(candidate.id);
        Contract after = before;
        if (!lifecycle_.expireIfDue(after, now)) {
            continue;
        }

        LedgerChangeSet changes;
        changes.contract = after;
        changes.expectedVersion = before.version;
        commitAndPublish(before, std::move(changes), {}, "End date passed");
        expired.push_back(candidate.id);
    }

    if (!expired.empty()) {
        std::cout << "[LedgerService] Expired " << expired.size() << " contract(s)" << std::endl;
    }
    return expired;
}

// ============================================================================
// MONEY
// ============================================================================

Transaction LedgerService::applyPayment(const domain::PaymentRecord& record) {
    auto lock = locks_.acquire(record.contractId);

    if (auto booked = findDuplicateDelivery(record)) {
        std::cout << "[LedgerService] Payment " << record.externalReference << " already booked as "
                  << booked->id << ", skipping redelivery" << std::endl;
        return *booked;
    }

    Timestamp now = clock_->now();
    Contract before = loadSettled(record.contractId, record.receivedAt > now ? record.receivedAt : now);
    Contract working = before;
    auto records = store_->findCommissionsByContract(record.contractId);

    PaymentOutcome outcome = engine_.applyPayment(working, record);
    auto upserts = commissions_.onPaymentRecognized(working, outcome.payment, records, record.receivedAt);
    lifecycle_.completeIfPaid(working, record.receivedAt);

    LedgerChangeSet changes;
    changes.contract = working;
    changes.expectedVersion = before.version;
    changes.newTransactions = outcome.penalties;
    changes.newTransactions.push_back(outcome.payment);
    changes.commissionUpserts = std::move(upserts);

    commitAndPublish(before, std::move(changes), records, "Fully paid");

    std::cout << "[LedgerService] Applied payment " << outcome.payment.id
              << " contract=" << record.contractId
              << " principal=" << outcome.payment.amount.toString()
              << " balance=" << outcome.payment.balanceAfter.toString() << std::endl;
    return outcome.payment;
}

Transaction LedgerService::reverseTransaction(const std::string& transactionId, const std::string& reason) {
    auto original = store_->findTransaction(transactionId);
    if (!original) {
        throw domain::NotFoundError("Transaction not found: " + transactionId);
    }

    auto lock = locks_.acquire(original->contractId);
    Timestamp now = clock_->now();
    Contract before = loadSettled(original->contractId, now);
    Contract working = before;
    auto records = store_->findCommissionsByContract(before.id);

    Transaction reversal = engine_.reverseTransaction(
        working, *original, store_->findReversalOf(transactionId), reason, now);

    LedgerChangeSet changes;
    if (original->type == domain::TransactionType::PAYMENT) {
        changes.commissionUpserts = commissions_.onPaymentReversed(working, reversal, records, now);
    } else if (original->type == domain::TransactionType::COMMISSION_PAYOUT && original->commissionRecordId) {
        auto paid = store_->findCommission(*original->commissionRecordId);
        if (!paid) {
            throw domain::NotFoundError("Commission record not found: " + *original->commissionRecordId);
        }
        changes.commissionUpserts.push_back(commissions_.onPayoutReversed(*paid, records, now));
    }

    changes.contract = working;
    changes.expectedVersion = before.version;
    changes.newTransactions.push_back(reversal);
    commitAndPublish(before, std::move(changes), records);

    std::cout << "[LedgerService] Reversed " << domain::toString(original->type) << " " << transactionId
              << " by " << reversal.id << ": " << reason << std::endl;
    return reversal;
}

Transaction LedgerService::refund(const std::string& contractId, const Money& amount, const std::string& reason) {
    auto lock = locks_.acquire(contractId);
    Contract before = loadContract(contractId);
    Contract working = before;

    Transaction entry = engine_.refund(working, amount, reason, clock_->now());

    LedgerChangeSet changes;
    changes.contract = working;
    changes.expectedVersion = before.version;
    changes.newTransactions.push_back(entry);
    commitAndPublish(before, std::move(changes), {});

    std::cout << "[LedgerService] Refunded " << amount.toString() << " on " << contractId << std::endl;
    return entry;
}

Transaction LedgerService::payoutCommission(const std::string& commissionRecordId) {
    auto found = store_->findCommission(commissionRecordId);
    if (!found) {
        throw domain::NotFoundError("Commission record not found: " + commissionRecordId);
    }

    auto lock = locks_.acquire(found->contractId);
    // Перечитываем под блокировкой: запись могла быть выплачена параллельно
    auto record = store_->findCommission(commissionRecordId);
    if (!record) {
        throw domain::NotFoundError("Commission record not found: " + commissionRecordId);
    }
    Contract before = loadContract(found->contractId);
    Timestamp now = clock_->now();

    Transaction payout = engine_.recordCommissionPayout(before, *record, now);
    CommissionRecord paid = commissions_.markPaid(*record, payout.id, now);

    LedgerChangeSet changes;
    changes.contract = before;
    changes.expectedVersion = before.version;
    changes.newTransactions.push_back(payout);
    changes.commissionUpserts.push_back(paid);
    commitAndPublish(before, std::move(changes), {*record});

    std::cout << "[LedgerService] Paid " << domain::toString(paid.beneficiaryRole) << " commission "
              << paid.id << " amount=" << paid.computedAmount.toString() << std::endl;
    return payout;
}

std::vector<Transaction> LedgerService::assessPenalties(const std::string& contractId) {
    auto lock = locks_.acquire(contractId);
    Timestamp now = clock_->now();
    Contract before = loadSettled(contractId, now);
    Contract working = before;

    auto penalties = engine_.assessPenalties(working, now);

    LedgerChangeSet changes;
    changes.contract = working;
    changes.expectedVersion = before.version;
    changes.newTransactions = penalties;
    commitAndPublish(before, std::move(changes), {});

    std::cout << "[LedgerService] Assessed " << penalties.size() << " penalty(ies) on " << contractId << std::endl;
    return penalties;
}

// ============================================================================
// QUERIES
// ============================================================================

std::optional<Contract> LedgerService::getContract(const std::string& contractId) {
    return store_->findContract(contractId);
}

std::vector<Transaction> LedgerService::getTransactions(const std::string& contractId) {
    return store_->findTransactionsByContract(contractId);
}

std::vector<CommissionRecord> LedgerService::getCommissions(const std::string& contractId) {
    return store_->findCommissionsByContract(contractId);
}

domain::PaymentProgress LedgerService::getPaymentProgress(const std::string& contractId) {
    return domain::progress::paymentProgress(loadContract(contractId));
}

ConstructionStatus LedgerService::getConstructionStatus(const std::string& contractId) {
    Contract contract = loadContract(contractId);
    domain::Property property = loadProperty(contract.propertyId);
    return ConstructionTrigger::evaluate(property, contract.totalAmount, domain::progress::principalPaid(contract));
}

// ============================================================================
// INTERNALS
// ============================================================================

Contract LedgerService::loadContract(const std::string& contractId) {
    auto contract = store_->findContract(contractId);
    if (!contract) {
        throw domain::NotFoundError("Contract not found: " + contractId);
    }
    return *contract;
}

Contract LedgerService::loadSettled(const std::string& contractId, const Timestamp& at) {
    Contract before = loadContract(contractId);
    Contract expired = before;
    if (!lifecycle_.expireIfDue(expired, at)) {
        return before;
    }

    LedgerChangeSet changes;
    changes.contract = expired;
    changes.expectedVersion = before.version;
    return commitAndPublish(before, std::move(changes), {}, "End date passed");
}

std::optional<Transaction> LedgerService::findDuplicateDelivery(const domain::PaymentRecord& record) {
    if (record.externalReference.empty()) {
        return std::nullopt;
    }
    auto booked = store_->findPaymentByExternalReference(record.externalReference);
    if (!booked) {
        return std::nullopt;
    }
    if (booked->contractId != record.contractId) {
        throw domain::DuplicatePaymentError("Payment reference " + record.externalReference +
                                            " is already booked on contract " + booked->contractId);
    }
    // Сумма PAYMENT - только основной долг, поэтому сверяем с суммой поступления
    Money received = booked->amount + booked->penaltyAllocated();
    if (received != record.amount) {
        throw domain::DuplicatePaymentError("Payment reference " + record.externalReference + " is booked with amount " +
                                            received.toString() + ", redelivered with " + record.amount.toString());
    }
    return booked;
}

domain::Property LedgerService::loadProperty(const std::string& propertyId) {
    auto property = store_->findProperty(propertyId);
    if (!property) {
        throw domain::NotFoundError("Property not found: " + propertyId);
    }
    return *property;
}

Contract LedgerService::commitAndPublish(
    const Contract& before,
    LedgerChangeSet changes,
    const std::vector<CommissionRecord>& previousCommissions,
    const std::string& reason
) {
    changes.contract.updatedAt = clock_->now();
    Contract committed = store_->commit(changes);

    for (const auto& transaction : changes.newTransactions) {
        publish(domain::LedgerTransactionEvent(transaction));
    }

    for (const auto& record : changes.commissionUpserts) {
        Money delta = record.computedAmount;
        for (const auto& previous : previousCommissions) {
            if (previous.id == record.id) {
                delta = record.computedAmount - previous.computedAmount;
                break;
            }
        }
        if (!delta.isZero()) {
            publish(domain::CommissionAccruedEvent(record, delta));
        }
    }

    if (before.status != committed.status) {
        std::cout << "[LedgerService] Contract " << committed.id << " " << domain::toString(before.status)
                  << " -> " << domain::toString(committed.status) << std::endl;
        publish(domain::ContractStatusChangedEvent(committed.id, before.status, committed.status,
                                                   committed.updatedAt, reason));
    }

    for (const auto& event : milestoneEvents(before, committed)) {
        publish(*event);
    }

    return committed;
}

std::vector<std::unique_ptr<domain::DomainEvent>> LedgerService::milestoneEvents(
    const Contract& before,
    const Contract& after
) {
    std::vector<std::unique_ptr<domain::DomainEvent>> events;

    Money paidBefore = domain::progress::principalPaid(before);
    Money paidAfter = domain::progress::principalPaid(after);
    if (paidAfter <= paidBefore) {
        return events;
    }

    auto property = store_->findProperty(after.propertyId);
    if (!property) {
        return events;
    }

    auto previous = ConstructionTrigger::evaluate(*property, after.totalAmount, paidBefore);
    auto current = ConstructionTrigger::evaluate(*property, after.totalAmount, paidAfter);
    using Milestone = domain::ConstructionMilestoneEvent::Milestone;

    if (current.canStartConstruction && !previous.canStartConstruction) {
        events.push_back(std::make_unique<domain::ConstructionMilestoneEvent>(
            Milestone::CONSTRUCTION_START, after.id, property->id, paidAfter,
            current.constructionThreshold, after.updatedAt));
    }
    if (current.isTurnoverReady && !previous.isTurnoverReady) {
        events.push_back(std::make_unique<domain::ConstructionMilestoneEvent>(
            Milestone::TURNOVER, after.id, property->id, paidAfter,
            current.turnoverThreshold, after.updatedAt));
    }
    return events;
}

void LedgerService::publish(const domain::DomainEvent& event) {
    try {
        eventPublisher_->publish(event.eventType, event.toJson());
    } catch (const std::exception& e) {
        std::cerr << "[LedgerService] Failed to publish " << event.eventType << " " << event.eventId
                  << ": " << e.what() << std::endl;
    }
}

} // namespace realty::application
