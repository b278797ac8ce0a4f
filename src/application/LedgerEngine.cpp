#include "application/LedgerEngine.hpp"
#include "domain/LedgerErrors.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <stdexcept>

namespace realty::application {

using domain::Contract;
using domain::ContractStatus;
using domain::InstallmentAllocation;
using domain::Money;
using domain::ScheduledInstallment;
using domain::Timestamp;
using domain::Transaction;
using domain::TransactionType;

namespace {

void requirePositive(const Money& amount, const std::string& what) {
    if (!amount.isPositive()) {
        throw std::invalid_argument(what + " must be positive, got " + amount.toString());
    }
}

void requireContractCurrency(const Contract& contract, const Money& amount) {
    if (amount.currency != contract.currency()) {
        throw domain::CurrencyMismatch("Contract " + contract.id + " is in " + contract.currency() +
                                       ", amount is in " + amount.currency);
    }
}

InstallmentAllocation& allocationFor(std::vector<InstallmentAllocation>& allocations, int number,
                                     const std::string& currency) {
    for (auto& allocation : allocations) {
        if (allocation.installmentNumber == number) {
            return allocation;
        }
    }
    allocations.push_back(InstallmentAllocation{number, Money::zero(currency), Money::zero(currency)});
    return allocations.back();
}

} // namespace

LedgerEngine::LedgerEngine(domain::LedgerPolicy policy)
    : policy_(std::move(policy))
{
    policy_.validate();
}

PaymentOutcome LedgerEngine::applyPayment(Contract& contract, const domain::PaymentRecord& record) const {
    if (contract.status != ContractStatus::ACTIVE) {
        throw domain::ContractNotPayableError("Contract " + contract.id + " does not accept payments in status " +
                                              domain::toString(contract.status));
    }
    requireContractCurrency(contract, record.amount);
    requirePositive(record.amount, "Payment amount");

    Contract working = contract;
    const auto& currency = working.currency();

    PaymentOutcome outcome;
    outcome.penalties = assessPenaltiesOn(working, record.receivedAt);

    // Открытые взносы от самого раннего срока к позднему
    std::vector<size_t> open;
    for (size_t i = 0; i < working.installments.size(); ++i) {
        if (!working.installments[i].isSettled()) {
            open.push_back(i);
        }
    }
    std::stable_sort(open.begin(), open.end(), [&working](size_t a, size_t b) {
        const auto& lhs = working.installments[a];
        const auto& rhs = working.installments[b];
        if (lhs.dueDate != rhs.dueDate) {
            return lhs.dueDate < rhs.dueDate;
        }
        return lhs.installmentNumber < rhs.installmentNumber;
    });

    Money remaining = record.amount;
    std::vector<InstallmentAllocation> allocations;

    // Взнос поглощает не больше своего остатка основного долга, внутри
    // этой доли сначала гасятся пени. Если пени съели часть доли, остаток
    // взноса добирается следующим проходом.
    bool progressed = true;
    while (remaining.isPositive() && progressed) {
        progressed = false;
        for (size_t index : open) {
            if (!remaining.isPositive()) {
                break;
            }
            ScheduledInstallment& installment = working.installments[index];
            Money owed = installment.outstandingPrincipal();
            if (!owed.isPositive()) {
                continue;
            }

            Money slice = Money::min(remaining, owed);
            Money penaltyPart = Money::min(slice, installment.outstandingPenalty());
            if (penaltyPart.isNegative()) {
                penaltyPart = Money::zero(currency);
            }
            Money principalPart = slice - penaltyPart;

            installment.penaltyPaid += penaltyPart;
            installment.paidAmount += principalPart;
            if (installment.isSettled()) {
                installment.paidDate = record.receivedAt;
                installment.isOverdue = false;
            }

            auto& allocation = allocationFor(allocations, installment.installmentNumber, currency);
            allocation.penalty += penaltyPart;
            allocation.principal += principalPart;

            remaining -= slice;
            progressed = true;
        }
    }

    if (remaining.isPositive()) {
        if (!working.allowPrepayment) {
            throw domain::OverpaymentError("Payment " + record.amount.toString() + " to contract " + contract.id +
                                           " exceeds outstanding principal by " + remaining.toString());
        }

        // Предоплата уходит в следующий внеплановый ежемесячный взнос
        int nextNumber = 0;
        Timestamp lastDue = working.startDate;
        for (const auto& installment : working.installments) {
            nextNumber = std::max(nextNumber, installment.installmentNumber);
            if (installment.dueDate > lastDue) {
                lastDue = installment.dueDate;
            }
        }

        ScheduledInstallment prepayment;
        prepayment.contractId = working.id;
        prepayment.installmentNumber = nextNumber + 1;
        prepayment.amount = remaining;
        prepayment.dueDate = lastDue.addMonths(1);
        prepayment.paymentType = domain::PaymentType::MONTHLY_AMORTIZATION;
        prepayment.paidAmount = remaining;
        prepayment.paidDate = record.receivedAt;
        prepayment.penaltyAmount = Money::zero(currency);
        prepayment.penaltyPaid = Money::zero(currency);
        prepayment.unscheduled = true;
        working.installments.push_back(prepayment);

        allocations.push_back(InstallmentAllocation{prepayment.installmentNumber, remaining, Money::zero(currency)});
    }

    Money principal = Money::zero(currency);
    for (const auto& allocation : allocations) {
        principal += allocation.principal;
    }

    Transaction payment = makeTransaction(working, TransactionType::PAYMENT, principal, record.receivedAt);
    payment.balanceAfter = payment.balanceBefore + principal;
    payment.allocations = std::move(allocations);
    payment.externalReference = record.externalReference;
    working.ledgerBalance = payment.balanceAfter;

    outcome.payment = payment;
    contract = std::move(working);
    return outcome;
}

std::vector<Transaction> LedgerEngine::assessPenalties(Contract& contract, const Timestamp& asOf) const {
    if (contract.status != ContractStatus::ACTIVE) {
        throw domain::ContractNotPayableError("Penalties accrue only on active contracts, " + contract.id + " is " +
                                              domain::toString(contract.status));
    }
    Contract working = contract;
    auto penalties = assessPenaltiesOn(working, asOf);
    contract = std::move(working);
    return penalties;
}

std::vector<Transaction> LedgerEngine::assessPenaltiesOn(Contract& working, const Timestamp& asOf) const {
    std::vector<Transaction> penalties;

    for (auto& installment : working.installments) {
        if (installment.isSettled() || installment.dueDate >= asOf) {
            continue;
        }

        int64_t days = installment.dueDate.daysUntil(asOf);
        if (days <= 0) {
            continue;
        }
        installment.isOverdue = true;
        installment.daysOverdue = days;

        if (days < policy_.penaltyGraceDays) {
            continue;
        }

        int64_t periods = std::max<int64_t>(1, days / policy_.penaltyPeriodDays);
        int64_t newPeriods = periods - installment.penaltyPeriodsAssessed;
        if (newPeriods <= 0) {
            continue;
        }
        if (!policy_.penaltyRatePerMonth) {
            throw domain::ConfigurationError("Penalty rate is not configured, cannot assess overdue installment " +
                                             std::to_string(installment.installmentNumber) + " of contract " +
                                             working.id);
        }

        // Пеня считается с непогашенного остатка, а не со всей суммы взноса
        Money penalty = installment.outstandingPrincipal().multiplyByPercent(
            policy_.penaltyRatePerMonth->times(newPeriods));
        installment.penaltyPeriodsAssessed = periods;
        if (penalty.isZero()) {
            continue;
        }
        installment.penaltyAmount += penalty;

        Transaction entry = makeTransaction(working, TransactionType::PENALTY, penalty, asOf);
        entry.allocations.push_back(
            InstallmentAllocation{installment.installmentNumber, Money::zero(penalty.currency), penalty});
        entry.reason = "Installment " + std::to_string(installment.installmentNumber) + " overdue " +
                       std::to_string(days) + " days";
        penalties.push_back(entry);
    }

    return penalties;
}

Transaction LedgerEngine::reverseTransaction(
    Contract& contract,
    const Transaction& original,
    const std::optional<std::string>& existingReversalId,
    const std::string& reason,
    const Timestamp& at
) const {
    if (original.contractId != contract.id) {
        throw domain::InvalidReversalError("Transaction " + original.id + " does not belong to contract " + contract.id);
    }
    if (original.isReversal()) {
        throw domain::InvalidReversalError("Transaction " + original.id + " is a reversal and cannot be reversed");
    }
    if (existingReversalId) {
        throw domain::AlreadyReversedError("Transaction " + original.id + " is already reversed by " +
                                           *existingReversalId);
    }

    Contract working = contract;

    switch (original.type) {
        case TransactionType::PAYMENT:
            if (working.status != ContractStatus::ACTIVE) {
                throw domain::InvalidReversalError("Payment " + original.id + " cannot be reversed on contract in status " +
                                                   domain::toString(working.status));
            }
            unwindAllocations(working, original, at);
            break;
        case TransactionType::PENALTY:
            waivePenalty(working, original);
            break;
        case TransactionType::REFUND:
        case TransactionType::COMMISSION_PAYOUT:
        case TransactionType::REVERSAL:
            break;
    }

    Transaction reversal = makeTransaction(working, TransactionType::REVERSAL, original.amount.negate(), at);
    reversal.reversedTransactionId = original.id;
    reversal.reversedType = original.type;
    reversal.commissionRecordId = original.commissionRecordId;
    reversal.reason = reason;
    for (const auto& allocation : original.allocations) {
        reversal.allocations.push_back(InstallmentAllocation{
            allocation.installmentNumber, allocation.principal.negate(), allocation.penalty.negate()});
    }
    reversal.balanceAfter = reversal.balanceBefore + reversal.signedAmount();
    working.ledgerBalance = reversal.balanceAfter;

    contract = std::move(working);
    return reversal;
}

void LedgerEngine::unwindAllocations(Contract& working, const Transaction& original, const Timestamp& at) const {
    for (const auto& allocation : original.allocations) {
        ScheduledInstallment* installment = working.findInstallment(allocation.installmentNumber);
        if (!installment) {
            throw domain::InvalidReversalError("Installment " + std::to_string(allocation.installmentNumber) +
                                               " of transaction " + original.id + " no longer exists");
        }

        installment->paidAmount -= allocation.principal;
        installment->penaltyPaid -= allocation.penalty;
        if (installment->paidAmount.isNegative() || installment->penaltyPaid.isNegative()) {
            throw domain::InvalidReversalError("Reversal of " + original.id + " would make installment " +
                                               std::to_string(allocation.installmentNumber) + " negative");
        }

        if (!installment->isSettled()) {
            installment->paidDate.reset();
            int64_t days = installment->dueDate.daysUntil(at);
            if (installment->dueDate < at && days > 0) {
                installment->isOverdue = true;
                installment->daysOverdue = days;
            }
        }
    }

    // Полностью откатанная предоплата исчезает из графика
    working.installments.erase(
        std::remove_if(working.installments.begin(), working.installments.end(),
                       [](const ScheduledInstallment& installment) {
                           return installment.unscheduled && installment.paidAmount.isZero();
                       }),
        working.installments.end());
}

void LedgerEngine::waivePenalty(Contract& working, const Transaction& original) const {
    for (const auto& allocation : original.allocations) {
        ScheduledInstallment* installment = working.findInstallment(allocation.installmentNumber);
        if (!installment) {
            throw domain::InvalidReversalError("Installment " + std::to_string(allocation.installmentNumber) +
                                               " of penalty " + original.id + " no longer exists");
        }
        if (installment->outstandingPenalty() < allocation.penalty) {
            throw domain::InvalidReversalError("Penalty " + original.id + " has already been collected");
        }
        installment->penaltyAmount -= allocation.penalty;
    }
}

Transaction LedgerEngine::refund(
    Contract& contract,
    const Money& amount,
    const std::string& reason,
    const Timestamp& at
) const {
    if (contract.status != ContractStatus::CANCELLED && contract.status != ContractStatus::TERMINATED) {
        throw domain::ContractNotPayableError("Refunds are issued only for cancelled or terminated contracts, " +
                                              contract.id + " is " + domain::toString(contract.status));
    }
    requireContractCurrency(contract, amount);
    requirePositive(amount, "Refund amount");
    if (amount > contract.ledgerBalance) {
        throw domain::OverpaymentError("Refund " + amount.toString() + " exceeds contract balance " +
                                       contract.ledgerBalance.toString());
    }

    Transaction entry = makeTransaction(contract, TransactionType::REFUND, amount, at);
    entry.balanceAfter = entry.balanceBefore - amount;
    entry.reason = reason;
    contract.ledgerBalance = entry.balanceAfter;
    return entry;
}

Transaction LedgerEngine::recordCommissionPayout(
    const Contract& contract,
    const domain::CommissionRecord& record,
    const Timestamp& at
) const {
    if (record.contractId != contract.id) {
        throw std::invalid_argument("Commission record " + record.id + " does not belong to contract " + contract.id);
    }
    if (record.isPaid()) {
        throw domain::AlreadyPaidError("Commission " + record.id + " is already paid by " + *record.payoutTransactionId);
    }
    requirePositive(record.computedAmount, "Commission payout");

    Transaction entry = makeTransaction(contract, TransactionType::COMMISSION_PAYOUT, record.computedAmount, at);
    entry.commissionRecordId = record.id;
    entry.reason = domain::toString(record.beneficiaryRole) + " commission";
    return entry;
}

Transaction LedgerEngine::makeTransaction(const Contract& working, TransactionType type,
                                          const Money& amount, const Timestamp& at) const {
    Transaction entry;
    entry.id = utils::UuidGenerator::transactionId();
    entry.contractId = working.id;
    entry.type = type;
    entry.amount = amount;
    entry.balanceBefore = working.ledgerBalance;
    entry.balanceAfter = working.ledgerBalance;
    entry.createdAt = at;
    return entry;
}

} // namespace realty::application
