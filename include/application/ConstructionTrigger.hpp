#pragma once

#include "domain/Money.hpp"
#include "domain/Percent.hpp"
#include "domain/Property.hpp"

namespace realty::application {

/**
 * @brief Снимок строительных порогов по договору
 */
struct ConstructionStatus {
    domain::Money principalPaid;
    domain::Money constructionThreshold;    ///< Сумма, после которой можно начинать строительство
    domain::Money turnoverThreshold;        ///< Сумма готовности к передаче объекта
    bool canStartConstruction = false;
    bool isTurnoverReady = false;
    int64_t progressBasisPoints = 0;        ///< principalPaid / total, 10000 = 100%
};

/**
 * @brief Проверка порогов начала строительства и передачи объекта
 *
 * Чистые функции, без состояния. В сравнение идёт только основной долг,
 * пени не учитываются.
 */
class ConstructionTrigger {
public:
    /**
     * @brief Порог total * percent, округлённый вверх до минорной единицы
     *
     * principalPaid >= thresholdAmount тогда и только тогда, когда
     * principalPaid / total >= percent / 100 точно.
     */
    static domain::Money thresholdAmount(const domain::Money& contractTotal, const domain::Percent& percent) {
        constexpr int64_t kBasisPointsPerUnit = 10000;
        int64_t total = contractTotal.amount;
        int64_t bp = percent.basisPoints;
        if (total <= 0 || bp <= 0) {
            return domain::Money::zero(contractTotal.currency);
        }
        // ceil(total * bp / 10000) без переполнения
        int64_t whole = total / kBasisPointsPerUnit;
        int64_t rem = total % kBasisPointsPerUnit;
        int64_t result = whole * bp + (rem * bp + kBasisPointsPerUnit - 1) / kBasisPointsPerUnit;
        return domain::Money(result, contractTotal.currency);
    }

    static bool canStartConstruction(
        const domain::Property& property,
        const domain::Money& contractTotal,
        const domain::Money& principalPaid
    ) {
        return principalPaid >= thresholdAmount(contractTotal, property.constructionTriggerPercentage);
    }

    static bool isTurnoverReady(
        const domain::Property& property,
        const domain::Money& contractTotal,
        const domain::Money& principalPaid
    ) {
        return principalPaid >= thresholdAmount(contractTotal, property.turnoverReadinessPercentage);
    }

    static ConstructionStatus evaluate(
        const domain::Property& property,
        const domain::Money& contractTotal,
        const domain::Money& principalPaid
    ) {
        ConstructionStatus status;
        status.principalPaid = principalPaid;
        status.constructionThreshold = thresholdAmount(contractTotal, property.constructionTriggerPercentage);
        status.turnoverThreshold = thresholdAmount(contractTotal, property.turnoverReadinessPercentage);
        status.canStartConstruction = principalPaid >= status.constructionThreshold;
        status.isTurnoverReady = principalPaid >= status.turnoverThreshold;
        if (contractTotal.isPositive()) {
            status.progressBasisPoints = principalPaid.amount * 10000 / contractTotal.amount;
        }
        return status;
    }
};

} // namespace realty::application
