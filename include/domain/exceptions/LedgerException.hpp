#pragma once

#include <stdexcept>
#include <string>

/**
 * @file LedgerException.hpp
 * @brief Исключения доменного слоя и слоя хранения
 */

namespace ledgerflow::domain {

/**
 * @brief Базовое исключение леджера
 */
class LedgerException : public std::runtime_error {
public:
    explicit LedgerException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Отрицательная (или нечисловая) ставка
 *
 * Выбрасывается до любых изменений состояния.
 */
class InvalidRateError : public LedgerException {
public:
    explicit InvalidRateError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Некорректная запись: часы <= 0 или период уже закрыт
 */
class InvalidEntryError : public LedgerException {
public:
    explicit InvalidEntryError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Некорректная граница периода
 */
class InvalidPeriodError : public LedgerException {
public:
    explicit InvalidPeriodError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Ошибка записи в хранилище
 *
 * Состояние в памяти откатывается к значению до вызова,
 * операцию можно повторить.
 */
class PersistenceError : public LedgerException {
public:
    explicit PersistenceError(const std::string& message)
        : LedgerException(message) {}
};

} // namespace ledgerflow::domain
