#pragma once

#include "domain/Contract.hpp"
#include "domain/CommissionRecord.hpp"
#include "domain/Property.hpp"
#include "domain/Transaction.hpp"
#include <string>
#include <optional>
#include <vector>

namespace realty::ports::output {

/**
 * @brief Набор изменений одной операции леджера
 *
 * Сохраняется целиком или не сохраняется вовсе.
 */
struct LedgerChangeSet {
    domain::Contract contract;                              ///< Новое состояние договора с графиком
    int64_t expectedVersion = 0;                            ///< Версия, с которой договор был загружен
    std::vector<domain::Transaction> newTransactions;       ///< Новые проводки в порядке создания
    std::vector<domain::CommissionRecord> commissionUpserts;
};

/**
 * @brief Хранилище договоров, проводок и комиссий
 *
 * Output Port. Чтение возвращает копии последнего зафиксированного
 * состояния и не блокирует запись.
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual void saveProperty(const domain::Property& property) = 0;

    virtual std::optional<domain::Property> findProperty(const std::string& id) = 0;

    /**
     * @brief Сохранить новый договор (version = 1)
     * @return false если договор с таким ID уже есть
     */
    virtual bool createContract(const domain::Contract& contract) = 0;

    virtual std::optional<domain::Contract> findContract(const std::string& id) = 0;

    virtual std::vector<domain::Contract> findContractsByStatus(domain::ContractStatus status) = 0;

    virtual std::optional<domain::Transaction> findTransaction(const std::string& id) = 0;

    /**
     * @brief ID проводки, сторнирующей данную (уникальный индекс original -> reversal)
     */
    virtual std::optional<std::string> findReversalOf(const std::string& transactionId) = 0;

    /**
     * @brief PAYMENT с данным референсом шлюза (уникальный индекс по всем договорам)
     */
    virtual std::optional<domain::Transaction> findPaymentByExternalReference(const std::string& reference) = 0;

    /**
     * @brief Проводки договора в порядке создания
     */
    virtual std::vector<domain::Transaction> findTransactionsByContract(const std::string& contractId) = 0;

    virtual std::optional<domain::CommissionRecord> findCommission(const std::string& id) = 0;

    virtual std::vector<domain::CommissionRecord> findCommissionsByContract(const std::string& contractId) = 0;

    /**
     * @brief Атомарно зафиксировать изменения
     *
     * Версия договора в хранилище должна совпадать с expectedVersion,
     * после фиксации она увеличивается на единицу.
     *
     * @return Зафиксированный договор (с новой версией)
     * @throws ConcurrencyConflictError если версия изменилась
     * @throws NotFoundError если договора нет
     * @throws AlreadyReversedError если проводка уже сторнирована другой проводкой
     * @throws DuplicatePaymentError если референс шлюза уже занят другим PAYMENT
     */
    virtual domain::Contract commit(const LedgerChangeSet& changes) = 0;
};

} // namespace realty::ports::output
