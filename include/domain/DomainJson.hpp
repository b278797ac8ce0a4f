#pragma once

#include "domain/Contract.hpp"
#include "domain/ContractProgress.hpp"
#include "domain/CommissionRecord.hpp"
#include "domain/Property.hpp"
#include "domain/Transaction.hpp"
#include <nlohmann/json.hpp>

/**
 * @file DomainJson.hpp
 * @brief JSON-представление доменных типов (nlohmann ADL)
 *
 * Деньги на границе: {"amount": <целое в минорных единицах>, "currency": "PHP"}.
 * Дробные числа в amount не принимаются. Ставки передаются строкой "5.00".
 */

namespace realty::domain {

void to_json(nlohmann::json& j, const Money& money);

/**
 * @throws std::invalid_argument если amount не целое число или currency не строка
 */
void from_json(const nlohmann::json& j, Money& money);

void to_json(nlohmann::json& j, const Percent& percent);

/**
 * @brief Ставка принимается строкой "5.00" или целым числом процентов
 * @throws std::invalid_argument для дробных чисел
 */
void from_json(const nlohmann::json& j, Percent& percent);

void to_json(nlohmann::json& j, const Timestamp& timestamp);
void from_json(const nlohmann::json& j, Timestamp& timestamp);

void to_json(nlohmann::json& j, const ScheduledInstallment& installment);
void to_json(nlohmann::json& j, const InstallmentAllocation& allocation);
void to_json(nlohmann::json& j, const Transaction& transaction);
void to_json(nlohmann::json& j, const CommissionRecord& record);
void to_json(nlohmann::json& j, const Contract& contract);
void to_json(nlohmann::json& j, const Property& property);
void to_json(nlohmann::json& j, const PaymentProgress& progress);

} // namespace realty::domain
