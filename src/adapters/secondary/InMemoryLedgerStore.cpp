#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "domain/LedgerErrors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace realty::adapters::secondary {

using domain::CommissionRecord;
using domain::Contract;
using domain::Transaction;

namespace {

template <typename T>
std::optional<T> copyOf(const std::shared_ptr<T>& value) {
    return value ? std::optional<T>(*value) : std::nullopt;
}

bool hasPaymentReference(const Transaction& transaction) {
    return transaction.type == domain::TransactionType::PAYMENT && !transaction.externalReference.empty();
}

} // namespace

InMemoryLedgerStore::InMemoryLedgerStore() {
    std::cout << "[InMemoryLedgerStore] Created" << std::endl;
}

void InMemoryLedgerStore::saveProperty(const domain::Property& property) {
    properties_.insert(property.id, std::make_shared<domain::Property>(property));
}

std::optional<domain::Property> InMemoryLedgerStore::findProperty(const std::string& id) {
    return copyOf(properties_.find(id));
}

bool InMemoryLedgerStore::createContract(const Contract& contract) {
    std::lock_guard<std::mutex> lock(commitMutex_);
    if (contracts_.contains(contract.id)) {
        return false;
    }
    auto stored = std::make_shared<Contract>(contract);
    stored->version = 1;
    contracts_.insert(contract.id, stored);
    contractTransactions_.insert(contract.id, std::make_shared<std::vector<std::string>>());
    contractCommissions_.insert(contract.id, std::make_shared<std::vector<std::string>>());
    return true;
}

std::optional<Contract> InMemoryLedgerStore::findContract(const std::string& id) {
    return copyOf(contracts_.find(id));
}

std::vector<Contract> InMemoryLedgerStore::findContractsByStatus(domain::ContractStatus status) {
    std::vector<Contract> result;
    for (const auto& contract : contracts_.getAll()) {
        if (contract->status == status) {
            result.push_back(*contract);
        }
    }
    std::sort(result.begin(), result.end(), [](const Contract& a, const Contract& b) {
        return a.id < b.id;
    });
    return result;
}

std::optional<Transaction> InMemoryLedgerStore::findTransaction(const std::string& id) {
    return copyOf(transactions_.find(id));
}

std::optional<std::string> InMemoryLedgerStore::findReversalOf(const std::string& transactionId) {
    return copyOf(reversals_.find(transactionId));
}

std::optional<Transaction> InMemoryLedgerStore::findPaymentByExternalReference(const std::string& reference) {
    auto id = paymentReferences_.find(reference);
    if (!id) {
        return std::nullopt;
    }
    return copyOf(transactions_.find(*id));
}

std::vector<Transaction> InMemoryLedgerStore::findTransactionsByContract(const std::string& contractId) {
    std::vector<Transaction> result;
    auto ids = contractTransactions_.find(contractId);
    if (!ids) {
        return result;
    }
    result.reserve(ids->size());
    for (const auto& id : *ids) {
        if (auto transaction = transactions_.find(id)) {
            result.push_back(*transaction);
        }
    }
    return result;
}

std::optional<CommissionRecord> InMemoryLedgerStore::findCommission(const std::string& id) {
    return copyOf(commissions_.find(id));
}

std::vector<CommissionRecord> InMemoryLedgerStore::findCommissionsByContract(const std::string& contractId) {
    std::vector<CommissionRecord> result;
    auto ids = contractCommissions_.find(contractId);
    if (!ids) {
        return result;
    }
    for (const auto& id : *ids) {
        if (auto record = commissions_.find(id)) {
            result.push_back(*record);
        }
    }
    return result;
}

Contract InMemoryLedgerStore::commit(const ports::output::LedgerChangeSet& changes) {
    std::lock_guard<std::mutex> lock(commitMutex_);

    const auto& contractId = changes.contract.id;
    auto current = contracts_.find(contractId);
    if (!current) {
        throw domain::NotFoundError("Contract not found: " + contractId);
    }
    if (current->version != changes.expectedVersion) {
        throw domain::ConcurrencyConflictError("Contract " + contractId + " is at version " +
                                               std::to_string(current->version) + ", expected " +
                                               std::to_string(changes.expectedVersion));
    }

    // Все проверки до первой записи: фиксация либо целиком, либо никак
    std::unordered_set<std::string> reversedInBatch;
    std::unordered_set<std::string> referencesInBatch;
    for (const auto& transaction : changes.newTransactions) {
        if (transaction.contractId != contractId) {
            throw std::invalid_argument("Transaction " + transaction.id + " does not belong to contract " + contractId);
        }
        if (transactions_.contains(transaction.id)) {
            throw std::invalid_argument("Duplicate transaction id: " + transaction.id);
        }
        if (transaction.reversedTransactionId) {
            const auto& originalId = *transaction.reversedTransactionId;
            if (reversals_.contains(originalId) || !reversedInBatch.insert(originalId).second) {
                throw domain::AlreadyReversedError("Transaction " + originalId + " is already reversed");
            }
        }
        if (hasPaymentReference(transaction)) {
            const auto& reference = transaction.externalReference;
            if (paymentReferences_.contains(reference) || !referencesInBatch.insert(reference).second) {
                throw domain::DuplicatePaymentError("Payment reference " + reference + " is already booked");
            }
        }
    }
    for (const auto& record : changes.commissionUpserts) {
        if (record.contractId != contractId) {
            throw std::invalid_argument("Commission " + record.id + " does not belong to contract " + contractId);
        }
        auto existing = commissions_.find(record.id);
        if (existing && existing->isPaid()) {
            throw domain::AlreadyPaidError("Commission " + record.id + " is paid and cannot change");
        }
    }

    auto stored = std::make_shared<Contract>(changes.contract);
    stored->version = current->version + 1;

    auto transactionIds = std::make_shared<std::vector<std::string>>(*contractTransactions_.find(contractId));
    for (const auto& transaction : changes.newTransactions) {
        transactions_.insert(transaction.id, std::make_shared<Transaction>(transaction));
        transactionIds->push_back(transaction.id);
        if (transaction.reversedTransactionId) {
            reversals_.insert(*transaction.reversedTransactionId, std::make_shared<std::string>(transaction.id));
        }
        if (hasPaymentReference(transaction)) {
            paymentReferences_.insert(transaction.externalReference, std::make_shared<std::string>(transaction.id));
        }
    }

    auto commissionIds = std::make_shared<std::vector<std::string>>(*contractCommissions_.find(contractId));
    for (const auto& record : changes.commissionUpserts) {
        if (!commissions_.contains(record.id)) {
            commissionIds->push_back(record.id);
        }
        commissions_.insert(record.id, std::make_shared<CommissionRecord>(record));
    }

    contractTransactions_.insert(contractId, transactionIds);
    contractCommissions_.insert(contractId, commissionIds);
    contracts_.insert(contractId, stored);

    return *stored;
}

} // namespace realty::adapters::secondary
