#pragma once

#include "domain/Timestamp.hpp"

namespace realty::ports::output {

/**
 * @brief Источник текущего времени
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Timestamp now() const = 0;
};

} // namespace realty::ports::output
