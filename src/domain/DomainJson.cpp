#include "domain/DomainJson.hpp"
#include <stdexcept>

namespace realty::domain {

void to_json(nlohmann::json& j, const Money& money) {
    j = nlohmann::json{{"amount", money.amount}, {"currency", money.currency}};
}

void from_json(const nlohmann::json& j, Money& money) {
    if (!j.is_object() || !j.contains("amount")) {
        throw std::invalid_argument("Money must be an object with integer 'amount' in minor units");
    }
    const auto& amount = j.at("amount");
    if (!amount.is_number_integer()) {
        throw std::invalid_argument("Money amount must be an integer number of minor units, got " + amount.dump());
    }
    money.amount = amount.get<int64_t>();
    if (j.contains("currency")) {
        if (!j.at("currency").is_string()) {
            throw std::invalid_argument("Money currency must be a string");
        }
        money.currency = j.at("currency").get<std::string>();
    }
}

void to_json(nlohmann::json& j, const Percent& percent) {
    j = percent.toString();
}

void from_json(const nlohmann::json& j, Percent& percent) {
    if (j.is_string()) {
        percent = Percent::fromString(j.get<std::string>());
    } else if (j.is_number_integer()) {
        percent = Percent::fromWhole(j.get<int64_t>());
    } else {
        throw std::invalid_argument("Percent must be a decimal string like \"5.00\", got " + j.dump());
    }
}

void to_json(nlohmann::json& j, const Timestamp& timestamp) {
    j = timestamp.toString();
}

void from_json(const nlohmann::json& j, Timestamp& timestamp) {
    timestamp = Timestamp::fromString(j.get<std::string>());
}

void to_json(nlohmann::json& j, const ScheduledInstallment& installment) {
    j = nlohmann::json{
        {"installmentNumber", installment.installmentNumber},
        {"amount", installment.amount},
        {"dueDate", installment.dueDate},
        {"paymentType", toString(installment.paymentType)},
        {"paidAmount", installment.paidAmount},
        {"isOverdue", installment.isOverdue},
        {"daysOverdue", installment.daysOverdue},
        {"penaltyAmount", installment.penaltyAmount},
        {"penaltyPaid", installment.penaltyPaid},
        {"unscheduled", installment.unscheduled}
    };
    if (installment.paidDate) {
        j["paidDate"] = *installment.paidDate;
    }
}

void to_json(nlohmann::json& j, const InstallmentAllocation& allocation) {
    j = nlohmann::json{
        {"installmentNumber", allocation.installmentNumber},
        {"principal", allocation.principal},
        {"penalty", allocation.penalty}
    };
}

void to_json(nlohmann::json& j, const Transaction& transaction) {
    j = nlohmann::json{
        {"id", transaction.id},
        {"contractId", transaction.contractId},
        {"type", toString(transaction.type)},
        {"amount", transaction.amount},
        {"balanceBefore", transaction.balanceBefore},
        {"balanceAfter", transaction.balanceAfter},
        {"allocations", transaction.allocations},
        {"createdAt", transaction.createdAt}
    };
    if (transaction.reversedTransactionId) {
        j["reversedTransactionId"] = *transaction.reversedTransactionId;
    }
    if (transaction.reversedType) {
        j["reversedType"] = toString(*transaction.reversedType);
    }
    if (transaction.commissionRecordId) {
        j["commissionRecordId"] = *transaction.commissionRecordId;
    }
    if (!transaction.externalReference.empty()) {
        j["externalReference"] = transaction.externalReference;
    }
    if (!transaction.reason.empty()) {
        j["reason"] = transaction.reason;
    }
}

void to_json(nlohmann::json& j, const CommissionRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"contractId", record.contractId},
        {"beneficiaryRole", toString(record.beneficiaryRole)},
        {"beneficiaryId", record.beneficiaryId},
        {"ratePercent", record.ratePercent},
        {"baseAmount", record.baseAmount},
        {"computedAmount", record.computedAmount},
        {"paid", record.isPaid()},
        {"updatedAt", record.updatedAt}
    };
    if (record.payoutTransactionId) {
        j["payoutTransactionId"] = *record.payoutTransactionId;
    }
}

void to_json(nlohmann::json& j, const Contract& contract) {
    j = nlohmann::json{
        {"id", contract.id},
        {"contractNumber", contract.contractNumber},
        {"type", toString(contract.type)},
        {"propertyId", contract.propertyId},
        {"clientId", contract.clientId},
        {"developerId", contract.developerId},
        {"status", toString(contract.status)},
        {"totalAmount", contract.totalAmount},
        {"reservationFee", contract.reservationFee},
        {"downpaymentAmount", contract.downpaymentAmount},
        {"equityAmount", contract.equityAmount},
        {"loanableAmount", contract.loanableAmount},
        {"monthlyPayment", contract.monthlyPayment},
        {"termMonths", contract.termMonths},
        {"startDate", contract.startDate},
        {"ledgerBalance", contract.ledgerBalance},
        {"principalPaid", progress::principalPaid(contract)},
        {"isFullySigned", progress::isFullySigned(contract)},
        {"installments", contract.installments},
        {"version", contract.version}
    };
    if (contract.agentId) {
        j["agentId"] = *contract.agentId;
    }
    if (contract.brokerId) {
        j["brokerId"] = *contract.brokerId;
    }
    if (contract.endDate) {
        j["endDate"] = *contract.endDate;
    }
    if (contract.commissionRateAgent) {
        j["commissionRateAgent"] = *contract.commissionRateAgent;
    }
    if (contract.commissionRateBroker) {
        j["commissionRateBroker"] = *contract.commissionRateBroker;
    }
    if (!contract.cancellationReason.empty()) {
        j["cancellationReason"] = contract.cancellationReason;
    }
}

void to_json(nlohmann::json& j, const Property& property) {
    j = nlohmann::json{
        {"id", property.id},
        {"price", property.price},
        {"constructionTriggerPercentage", property.constructionTriggerPercentage},
        {"turnoverReadinessPercentage", property.turnoverReadinessPercentage}
    };
}

void to_json(nlohmann::json& j, const PaymentProgress& progress) {
    j = nlohmann::json{
        {"totalAmount", progress.totalAmount},
        {"totalPaid", progress.totalPaid},
        {"remaining", progress.remaining},
        {"progressBasisPoints", progress.progressBasisPoints}
    };
}

} // namespace realty::domain
