#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "utils/ThreadSafeMap.hpp"
#include <mutex>
#include <unordered_map>

namespace realty::adapters::secondary {

/**
 * @brief In-memory реализация хранилища леджера
 *
 * Записи лежат в ThreadSafeMap как неизменяемые снимки, commit подменяет
 * их под единым мьютексом. Читатели видят либо состояние до фиксации,
 * либо после, и никогда не ждут писателя дольше подмены указателя.
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore {
public:
    InMemoryLedgerStore();

    void saveProperty(const domain::Property& property) override;
    std::optional<domain::Property> findProperty(const std::string& id) override;

    bool createContract(const domain::Contract& contract) override;
    std::optional<domain::Contract> findContract(const std::string& id) override;
    std::vector<domain::Contract> findContractsByStatus(domain::ContractStatus status) override;

    std::optional<domain::Transaction> findTransaction(const std::string& id) override;
    std::optional<std::string> findReversalOf(const std::string& transactionId) override;
    std::optional<domain::Transaction> findPaymentByExternalReference(const std::string& reference) override;
    std::vector<domain::Transaction> findTransactionsByContract(const std::string& contractId) override;

    std::optional<domain::CommissionRecord> findCommission(const std::string& id) override;
    std::vector<domain::CommissionRecord> findCommissionsByContract(const std::string& contractId) override;

    domain::Contract commit(const ports::output::LedgerChangeSet& changes) override;

private:
    utils::ThreadSafeMap<std::string, domain::Property> properties_;
    utils::ThreadSafeMap<std::string, domain::Contract> contracts_;
    utils::ThreadSafeMap<std::string, domain::Transaction> transactions_;
    utils::ThreadSafeMap<std::string, domain::CommissionRecord> commissions_;
    utils::ThreadSafeMap<std::string, std::string> reversals_;      ///< original id -> reversal id
    utils::ThreadSafeMap<std::string, std::string> paymentReferences_;  ///< референс шлюза -> PAYMENT id

    // Порядок проводок и список комиссий по договору
    utils::ThreadSafeMap<std::string, std::vector<std::string>> contractTransactions_;
    utils::ThreadSafeMap<std::string, std::vector<std::string>> contractCommissions_;

    std::mutex commitMutex_;
};

} // namespace realty::adapters::secondary
