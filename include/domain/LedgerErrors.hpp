#pragma once

#include <stdexcept>
#include <string>

/**
 * @file LedgerErrors.hpp
 * @brief Исключения движка леджера
 *
 * Каждая ошибка терминальна для вызвавшей её операции: движок не
 * повторяет операцию сам, состояние при этом не меняется.
 */

namespace realty::domain {

/**
 * @brief Базовое исключение леджера
 */
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * @brief Имя ошибки для внешней границы (JSON, логи)
     */
    virtual const char* name() const noexcept { return "LedgerError"; }
};

/**
 * @brief Операция над Money разных валют
 */
class CurrencyMismatch : public LedgerError {
public:
    explicit CurrencyMismatch(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "CurrencyMismatch"; }
};

/**
 * @brief Невозможно построить график платежей
 */
class InvalidScheduleError : public LedgerError {
public:
    explicit InvalidScheduleError(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "InvalidScheduleError"; }
};

/**
 * @brief Платёж превышает остаток по договору
 */
class OverpaymentError : public LedgerError {
public:
    explicit OverpaymentError(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "OverpaymentError"; }
};

/**
 * @brief Транзакция уже сторнирована
 */
class AlreadyReversedError : public LedgerError {
public:
    explicit AlreadyReversedError(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "AlreadyReversedError"; }
};

/**
 * @brief Транзакцию нельзя сторнировать
 */
class InvalidReversalError : public LedgerError {
public:
    explicit InvalidReversalError(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "InvalidReversalError"; }
};

/**
 * @brief Комиссия уже выплачена
 */
class AlreadyPaidError : public LedgerError {
public:
    explicit AlreadyPaidError(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "AlreadyPaidError"; }
};

/**
 * @brief Недопустимый переход статуса договора
 */
class InvalidTransitionError : public LedgerError {
public:
    explicit InvalidTransitionError(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "InvalidTransitionError"; }
};

/**
 * @brief Не задана ставка пени или комиссии
 */
class ConfigurationError : public LedgerError {
public:
    explicit ConfigurationError(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "ConfigurationError"; }
};

/**
 * @brief Договор, транзакция или запись комиссии не найдены
 */
class NotFoundError : public LedgerError {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "NotFoundError"; }
};

/**
 * @brief Сохранённая версия договора изменилась после загрузки
 */
class ConcurrencyConflictError : public LedgerError {
public:
    explicit ConcurrencyConflictError(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "ConcurrencyConflictError"; }
};

/**
 * @brief Договор в текущем статусе не принимает платежи
 */
class ContractNotPayableError : public LedgerError {
public:
    explicit ContractNotPayableError(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "ContractNotPayableError"; }
};

/**
 * @brief Референс платёжного шлюза уже использован другим платежом
 */
class DuplicatePaymentError : public LedgerError {
public:
    explicit DuplicatePaymentError(const std::string& message)
        : LedgerError(message) {}

    const char* name() const noexcept override { return "DuplicatePaymentError"; }
};

} // namespace realty::domain
