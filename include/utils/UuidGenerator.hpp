#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace realty::utils {

/**
 * @brief Идентификаторы сущностей леджера
 *
 * Договоры, проводки и записи комиссий получают короткий ID с префиксом
 * ("ctr-", "txn-", "com-"), события - полный UUID v4.
 * Генератор thread_local, общий для всех методов потока.
 */
class UuidGenerator {
public:
    static std::string generate() {
        uint64_t high = next();
        uint64_t low = next();

        std::ostringstream out;
        out << std::hex << std::setfill('0')
            << std::setw(8) << (high >> 32) << '-'
            << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
            << std::setw(4) << ((high & 0x0FFF) | 0x4000) << '-'
            << std::setw(4) << (((low >> 48) & 0x3FFF) | 0x8000) << '-'
            << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
        return out.str();
    }

    static std::string generateWithPrefix(const std::string& prefix) {
        std::ostringstream out;
        out << prefix << '-' << std::hex << std::setfill('0') << std::setw(16) << next();
        return out.str();
    }

    static std::string contractId() { return generateWithPrefix("ctr"); }
    static std::string transactionId() { return generateWithPrefix("txn"); }
    static std::string commissionId() { return generateWithPrefix("com"); }

private:
    static uint64_t next() {
        thread_local std::mt19937_64 engine{std::random_device{}()};
        return engine();
    }
};

} // namespace realty::utils
