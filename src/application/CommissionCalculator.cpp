#include "application/CommissionCalculator.hpp"
#include "domain/LedgerErrors.hpp"
#include "utils/UuidGenerator.hpp"
#include <stdexcept>

namespace realty::application {

using domain::CommissionRecord;
using domain::CommissionRole;
using domain::Contract;
using domain::Money;
using domain::Percent;
using domain::Timestamp;
using domain::Transaction;
using domain::TransactionType;

namespace {

const std::optional<std::string>& beneficiaryOf(const Contract& contract, CommissionRole role) {
    return role == CommissionRole::AGENT ? contract.agentId : contract.brokerId;
}

const CommissionRecord* findOpen(const std::vector<CommissionRecord>& records, CommissionRole role) {
    for (const auto& record : records) {
        if (record.beneficiaryRole == role && !record.isPaid()) {
            return &record;
        }
    }
    return nullptr;
}

CommissionRecord openRecord(const std::string& contractId, CommissionRole role, const std::string& beneficiaryId,
                            const Percent& rate, const std::string& currency, const Timestamp& at) {
    CommissionRecord record;
    record.id = utils::UuidGenerator::commissionId();
    record.contractId = contractId;
    record.beneficiaryRole = role;
    record.beneficiaryId = beneficiaryId;
    record.ratePercent = rate;
    record.baseAmount = Money::zero(currency);
    record.computedAmount = Money::zero(currency);
    record.createdAt = at;
    record.updatedAt = at;
    return record;
}

} // namespace

CommissionCalculator::CommissionCalculator(domain::LedgerPolicy policy)
    : policy_(std::move(policy))
{
    policy_.validate();
}

std::optional<Percent> CommissionCalculator::effectiveRate(const Contract& contract, CommissionRole role) const {
    if (!beneficiaryOf(contract, role)) {
        return std::nullopt;
    }

    const auto& contractRate = role == CommissionRole::AGENT ? contract.commissionRateAgent
                                                             : contract.commissionRateBroker;
    if (contractRate) {
        return contractRate;
    }

    const auto& defaultRate = role == CommissionRole::AGENT ? policy_.defaultAgentCommissionRate
                                                            : policy_.defaultBrokerCommissionRate;
    if (defaultRate) {
        return defaultRate;
    }

    throw domain::ConfigurationError(domain::toString(role) + " commission rate is not configured for contract " +
                                     contract.id);
}

std::vector<CommissionRecord> CommissionCalculator::onPaymentRecognized(
    const Contract& contract,
    const Transaction& payment,
    const std::vector<CommissionRecord>& records,
    const Timestamp& at
) const {
    if (payment.type != TransactionType::PAYMENT) {
        throw std::invalid_argument("Commission accrues only on PAYMENT transactions, got " +
                                    domain::toString(payment.type));
    }
    return accrue(contract, payment.amount, records, at);
}

std::vector<CommissionRecord> CommissionCalculator::onPaymentReversed(
    const Contract& contract,
    const Transaction& reversal,
    const std::vector<CommissionRecord>& records,
    const Timestamp& at
) const {
    if (!reversal.isReversal() || reversal.reversedType != TransactionType::PAYMENT) {
        throw std::invalid_argument("Commission clawback applies only to payment reversals");
    }
    // amount сторно уже отрицательный
    return accrue(contract, reversal.amount, records, at);
}

std::vector<CommissionRecord> CommissionCalculator::accrue(
    const Contract& contract,
    const Money& base,
    const std::vector<CommissionRecord>& records,
    const Timestamp& at
) const {
    std::vector<CommissionRecord> changed;
    // Платёж целиком ушёл в пени: начислять нечего
    if (base.isZero()) {
        return changed;
    }

    for (CommissionRole role : {CommissionRole::AGENT, CommissionRole::BROKER}) {
        auto rate = effectiveRate(contract, role);
        if (!rate || rate->isZero()) {
            continue;
        }

        const CommissionRecord* open = findOpen(records, role);
        CommissionRecord record = open ? *open
                                       : openRecord(contract.id, role, *beneficiaryOf(contract, role), *rate,
                                                    contract.currency(), at);

        // Ставка фиксируется в записи; если ставка договора поменялась, начисление идёт по новой
        record.ratePercent = *rate;
        record.baseAmount += base;
        record.computedAmount += base.multiplyByPercent(*rate);
        record.updatedAt = at;
        changed.push_back(record);
    }

    return changed;
}

CommissionRecord CommissionCalculator::onPayoutReversed(
    const CommissionRecord& paidRecord,
    const std::vector<CommissionRecord>& records,
    const Timestamp& at
) const {
    const CommissionRecord* open = findOpen(records, paidRecord.beneficiaryRole);
    CommissionRecord record = open ? *open
                                   : openRecord(paidRecord.contractId, paidRecord.beneficiaryRole,
                                                paidRecord.beneficiaryId, paidRecord.ratePercent,
                                                paidRecord.computedAmount.currency, at);
    record.baseAmount += paidRecord.baseAmount;
    record.computedAmount += paidRecord.computedAmount;
    record.updatedAt = at;
    return record;
}

CommissionRecord CommissionCalculator::markPaid(
    const CommissionRecord& record,
    const std::string& payoutTransactionId,
    const Timestamp& at
) const {
    if (record.isPaid()) {
        throw domain::AlreadyPaidError("Commission " + record.id + " is already paid by " +
                                       *record.payoutTransactionId);
    }
    CommissionRecord paid = record;
    paid.payoutTransactionId = payoutTransactionId;
    paid.updatedAt = at;
    return paid;
}

} // namespace realty::application
