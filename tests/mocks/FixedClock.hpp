#pragma once

#include "ports/output/IClock.hpp"
#include <mutex>

namespace realty::tests {

/**
 * @brief Часы с управляемым временем
 */
class FixedClock : public ports::output::IClock {
public:
    explicit FixedClock(domain::Timestamp now) : now_(now) {}

    domain::Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(domain::Timestamp now) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = now;
    }

    void advanceDays(int64_t days) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = now_.addDays(days);
    }

private:
    mutable std::mutex mutex_;
    domain::Timestamp now_;
};

} // namespace realty::tests
