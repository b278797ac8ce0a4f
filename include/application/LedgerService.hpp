#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "settings/ILedgerSettings.hpp"
#include "application/CommissionCalculator.hpp"
#include "application/ContractLifecycle.hpp"
#include "application/ContractLockRegistry.hpp"
#include "application/LedgerEngine.hpp"
#include "application/PaymentScheduleBuilder.hpp"
#include "domain/events/DomainEvent.hpp"
#include <memory>
#include <vector>

namespace realty::application {

/**
 * @brief Сервис леджера
 *
 * Каждая изменяющая операция:
 * 1. захватывает мьютекс договора;
 * 2. загружает снимок договора из хранилища;
 * 3. считает изменения (LedgerEngine, CommissionCalculator, ContractLifecycle);
 * 4. фиксирует их одним commit с проверкой версии;
 * 5. публикует события.
 *
 * Публикация идёт после фиксации; ошибка публикации логируется и не
 * откатывает операцию.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::ILedgerSettings> settings
    );

    void registerProperty(const domain::Property& property) override;
    domain::Contract registerContract(const domain::Contract& contract) override;
    domain::Contract prepareSchedule(const std::string& contractId) override;
    domain::Contract recordSignature(
        const std::string& contractId,
        domain::SignatureParty party,
        const std::string& blob) override;
    domain::Contract activate(const std::string& contractId) override;
    domain::Contract terminate(const std::string& contractId, const std::string& reason) override;
    domain::Contract cancel(const std::string& contractId, const std::string& reason) override;
    std::vector<std::string> expireContracts() override;

    domain::Transaction applyPayment(const domain::PaymentRecord& record) override;
    domain::Transaction reverseTransaction(const std::string& transactionId, const std::string& reason) override;
    domain::Transaction refund(
        const std::string& contractId,
        const domain::Money& amount,
        const std::string& reason) override;
    domain::Transaction payoutCommission(const std::string& commissionRecordId) override;
    std::vector<domain::Transaction> assessPenalties(const std::string& contractId) override;

    std::optional<domain::Contract> getContract(const std::string& contractId) override;
    std::vector<domain::Transaction> getTransactions(const std::string& contractId) override;
    std::vector<domain::CommissionRecord> getCommissions(const std::string& contractId) override;
    domain::PaymentProgress getPaymentProgress(const std::string& contractId) override;
    ConstructionStatus getConstructionStatus(const std::string& contractId) override;

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<ports::output::IClock> clock_;

    LedgerEngine engine_;
    CommissionCalculator commissions_;
    ContractLifecycle lifecycle_;
    PaymentScheduleBuilder scheduleBuilder_;
    ContractLockRegistry locks_;

    domain::Contract loadContract(const std::string& contractId);

    /**
     * @brief Загрузить договор, сначала зафиксировав истечение срока
     *
     * ACTIVE договор с endDate раньше at переводится в EXPIRED отдельным
     * commit; операция затем видит уже EXPIRED договор.
     */
    domain::Contract loadSettled(const std::string& contractId, const domain::Timestamp& at);

    /**
     * @brief Повторная доставка платежа шлюзом
     *
     * @return Ранее проведённый PAYMENT с тем же референсом и суммой
     * @throws DuplicatePaymentError если референс занят другим договором или суммой
     */
    std::optional<domain::Transaction> findDuplicateDelivery(const domain::PaymentRecord& record);
    domain::Property loadProperty(const std::string& propertyId);

    /**
     * @brief Зафиксировать изменения и опубликовать события
     *
     * @param before Договор в том виде, в каком он был загружен
     * @param changes Изменения операции (contract - новое состояние)
     * @param previousCommissions Записи комиссий до операции (для расчёта дельт)
     * @return Зафиксированный договор
     */
    domain::Contract commitAndPublish(
        const domain::Contract& before,
        ports::output::LedgerChangeSet changes,
        const std::vector<domain::CommissionRecord>& previousCommissions,
        const std::string& reason = ""
    );

    /**
     * @brief Изменение статуса договора без проводок (подпись, расторжение и т.п.)
     */
    template <typename Mutation>
    domain::Contract mutateContract(const std::string& contractId, Mutation mutation);

    std::vector<std::unique_ptr<domain::DomainEvent>> milestoneEvents(
        const domain::Contract& before,
        const domain::Contract& after
    );

    void publish(const domain::DomainEvent& event);
};

} // namespace realty::application
