#pragma once

#include "ports/input/ILedgerService.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace realty::adapters::primary {

/**
 * @brief JSON-граница сервиса леджера
 *
 * Запрос: {"command": "applyPayment", ...параметры}.
 * Ответ:  {"status": "ok", "result": ...} или
 *         {"status": "error", "error": "OverpaymentError", "message": "..."}.
 *
 * Деньги передаются как {"amount": <целое в минорных единицах>, "currency": "PHP"};
 * дробные суммы отклоняются с ошибкой InvalidRequest.
 *
 * Команды:
 * - registerProperty, registerContract, prepareSchedule, sign, activate
 * - applyPayment, reverse, refund, payoutCommission, assessPenalties
 * - terminate, cancel, expireContracts
 * - getContract, getTransactions, getCommissions, getProgress, getConstructionStatus
 */
class LedgerCommandHandler {
public:
    explicit LedgerCommandHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService);

    /**
     * @brief Выполнить команду
     * @param request JSON-строка запроса
     * @return JSON-строка ответа (никогда не бросает для ошибок запроса и леджера)
     */
    std::string handle(const std::string& request);

    /**
     * @brief Выполнить уже разобранную команду
     */
    nlohmann::json execute(const nlohmann::json& request);

private:
    using Command = std::function<nlohmann::json(const nlohmann::json&)>;

    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    std::unordered_map<std::string, Command> commands_;

    void registerCommands();

    static nlohmann::json errorResponse(const std::string& error, const std::string& message);
};

} // namespace realty::adapters::primary
