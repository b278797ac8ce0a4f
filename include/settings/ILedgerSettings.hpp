#pragma once

#include "domain/LedgerPolicy.hpp"

namespace realty::settings {

class ILedgerSettings {
public:
    virtual ~ILedgerSettings() = default;

    /**
     * @brief Политика леджера (ставки пени и комиссий, валюта)
     */
    virtual domain::LedgerPolicy getPolicy() const = 0;
};

} // namespace realty::settings
