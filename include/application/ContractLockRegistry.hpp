#pragma once

#include "utils/ThreadSafeMap.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace realty::application {

/**
 * @brief Мьютекс на каждый договор
 *
 * Изменяющие операции одного договора выполняются строго по очереди,
 * операции разных договоров не мешают друг другу.
 *
 * Мьютексы не удаляются: договор в терминальном статусе ещё принимает
 * возвраты, сторно и выплаты комиссий, а unique_lock держит ссылку на
 * мьютекс из реестра. Реестр растёт вместе с числом договоров, как и
 * InMemoryLedgerStore; при внешнем хранилище его нужно заменить на
 * блокировку на стороне хранилища.
 */
class ContractLockRegistry {
public:
    /**
     * @brief Захватить блокировку договора (блокирующе)
     */
    std::unique_lock<std::mutex> acquire(const std::string& contractId) {
        auto mutex = locks_.find(contractId);
        if (!mutex) {
            mutex = locks_.insertIfAbsent(contractId, std::make_shared<std::mutex>());
        }
        return std::unique_lock<std::mutex>(*mutex);
    }

    size_t size() const {
        return locks_.size();
    }

private:
    utils::ThreadSafeMap<std::string, std::mutex> locks_;
};

} // namespace realty::application
