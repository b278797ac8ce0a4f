#pragma once

#include "settings/ILedgerSettings.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace realty::settings {

/**
 * @brief Настройки политики леджера
 *
 * Значения по умолчанию, затем JSON-файл политики (если задан), затем
 * переменные окружения (K8s ENV) поверх файла.
 *
 * Переменные окружения:
 * - LEDGER_POLICY_FILE: путь к JSON-файлу политики
 * - LEDGER_CURRENCY: валюта договоров (PHP)
 * - LEDGER_PENALTY_RATE_PERCENT: пеня в месяц, "1.00"; по умолчанию не задана,
 *   пустая строка тоже означает "не задана"
 * - LEDGER_PENALTY_GRACE_DAYS: с какого дня просрочки начисляется пеня (30)
 * - LEDGER_PENALTY_PERIOD_DAYS: длина периода начисления (30)
 * - LEDGER_AGENT_COMMISSION_PERCENT: ставка агента по умолчанию
 * - LEDGER_BROKER_COMMISSION_PERCENT: ставка брокера по умолчанию
 *
 * @example K8s ConfigMap:
 * ```yaml
 * apiVersion: v1
 * kind: ConfigMap
 * metadata:
 *   name: ledger-config
 * data:
 *   LEDGER_CURRENCY: "PHP"
 *   LEDGER_PENALTY_RATE_PERCENT: "1.00"
 *   LEDGER_PENALTY_GRACE_DAYS: "30"
 *   LEDGER_AGENT_COMMISSION_PERCENT: "5.00"
 *   LEDGER_BROKER_COMMISSION_PERCENT: "2.00"
 * ```
 *
 * Файл политики:
 * ```json
 * {"currency": "PHP", "penaltyRatePercent": "1.00", "penaltyGraceDays": 30,
 *  "penaltyPeriodDays": 30, "agentCommissionPercent": "5.00"}
 * ```
 */
class LedgerSettings : public ILedgerSettings {
public:
    /**
     * @brief Конструктор - читает файл политики и ENV
     * @throws ConfigurationError при неверных значениях или нечитаемом файле
     */
    LedgerSettings();

    /**
     * @brief Применить JSON-объект политики поверх текущих значений
     * @throws ConfigurationError при неверных значениях
     */
    void applyJson(const nlohmann::json& config);

    domain::LedgerPolicy getPolicy() const override { return policy_; }

private:
    domain::LedgerPolicy policy_;

    void loadPolicyFile(const std::string& path);
    void applyEnvironment();

    /**
     * @brief Получить значение ENV или вернуть default
     */
    static std::string getEnvOrDefault(const char* name, const char* defaultValue);

    static std::optional<std::string> getEnv(const char* name);
};

} // namespace realty::settings
