#pragma once

#include "application/ConstructionTrigger.hpp"
#include "domain/Contract.hpp"
#include "domain/ContractProgress.hpp"
#include "domain/CommissionRecord.hpp"
#include "domain/PaymentRecord.hpp"
#include "domain/Property.hpp"
#include "domain/Transaction.hpp"
#include "domain/enums/SignatureParty.hpp"
#include <optional>
#include <string>
#include <vector>

namespace realty::ports::input {

/**
 * @brief Интерфейс сервиса леджера
 *
 * Все изменяющие операции атомарны: при исключении сохранённое состояние
 * не меняется.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    // ===== Договор =====

    virtual void registerProperty(const domain::Property& property) = 0;

    /**
     * @brief Зарегистрировать договор в статусе DRAFT
     * @throws InvalidScheduleError если финансовые условия не сходятся
     * @throws NotFoundError если объект недвижимости не зарегистрирован
     */
    virtual domain::Contract registerContract(const domain::Contract& contract) = 0;

    /**
     * @brief Построить график и отправить договор на подпись
     */
    virtual domain::Contract prepareSchedule(const std::string& contractId) = 0;

    virtual domain::Contract recordSignature(
        const std::string& contractId,
        domain::SignatureParty party,
        const std::string& blob) = 0;

    virtual domain::Contract activate(const std::string& contractId) = 0;

    virtual domain::Contract terminate(const std::string& contractId, const std::string& reason) = 0;

    virtual domain::Contract cancel(const std::string& contractId, const std::string& reason) = 0;

    /**
     * @brief Перевести в EXPIRED все активные договоры с истёкшим сроком
     * @return ID истёкших договоров
     */
    virtual std::vector<std::string> expireContracts() = 0;

    // ===== Деньги =====

    virtual domain::Transaction applyPayment(const domain::PaymentRecord& record) = 0;

    virtual domain::Transaction reverseTransaction(const std::string& transactionId, const std::string& reason) = 0;

    virtual domain::Transaction refund(
        const std::string& contractId,
        const domain::Money& amount,
        const std::string& reason) = 0;

    virtual domain::Transaction payoutCommission(const std::string& commissionRecordId) = 0;

    virtual std::vector<domain::Transaction> assessPenalties(const std::string& contractId) = 0;

    // ===== Чтение (без блокировки договора) =====

    virtual std::optional<domain::Contract> getContract(const std::string& contractId) = 0;

    virtual std::vector<domain::Transaction> getTransactions(const std::string& contractId) = 0;

    virtual std::vector<domain::CommissionRecord> getCommissions(const std::string& contractId) = 0;

    virtual domain::PaymentProgress getPaymentProgress(const std::string& contractId) = 0;

    virtual application::ConstructionStatus getConstructionStatus(const std::string& contractId) = 0;
};

} // namespace realty::ports::input
