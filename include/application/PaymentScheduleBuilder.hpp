#pragma once

#include "domain/Contract.hpp"
#include "domain/ScheduledInstallment.hpp"
#include <vector>

namespace realty::application {

/**
 * @brief Построитель графика платежей
 *
 * Порядок взносов:
 * 1. RESERVATION_FEE (если бронь > 0) - в дату начала договора,
 *    сумма брони вычитается из первоначального взноса
 * 2. DOWNPAYMENT - downpaymentMonths равных частей
 * 3. EQUITY - equityMonths равных частей
 * 4. MONTHLY_AMORTIZATION - кредитная часть (или аренда) на termMonths месяцев
 *
 * Взносы после брони идут ежемесячно в тот же день месяца, что и дата
 * начала. Остаток от округления уходит в последний взнос группы, поэтому
 * сумма графика равна totalAmount точно.
 */
class PaymentScheduleBuilder {
public:
    /**
     * @brief Построить график
     * @throws InvalidScheduleError если termMonths <= 0 или компоненты не сходятся с totalAmount
     */
    std::vector<domain::ScheduledInstallment> build(const domain::Contract& contract) const;

    /**
     * @brief Проверить финансовые условия договора без построения графика
     * @throws InvalidScheduleError
     */
    void validate(const domain::Contract& contract) const;

private:
    void appendGroup(
        std::vector<domain::ScheduledInstallment>& schedule,
        const domain::Contract& contract,
        domain::PaymentType type,
        const domain::Money& groupTotal,
        int parts,
        int& monthOffset
    ) const;
};

} // namespace realty::application
