#pragma once

#include "Money.hpp"
#include "Percent.hpp"
#include <string>

namespace realty::domain {

/**
 * @brief Объект недвижимости (только финансовые пороги)
 */
struct Property {
    std::string id;
    Money price;
    Percent constructionTriggerPercentage = Percent::fromWhole(50);  ///< Старт строительства
    Percent turnoverReadinessPercentage = Percent::fromWhole(85);    ///< Готовность к передаче
};

} // namespace realty::domain
