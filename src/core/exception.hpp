/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Transaction logger exception types

**************************************************/

#ifndef OTELLOGGER_CORE_EXCEPTION_HPP
#define OTELLOGGER_CORE_EXCEPTION_HPP

#include <exception>

#include "atom/error/exception.hpp"

namespace otellogger {

/**
 * @brief Operation referenced a trace ID that is not open
 */
class UnknownTransactionException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_UNKNOWN_TRANSACTION(...)                \
    throw otellogger::UnknownTransactionException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Severity value outside DEBUG..ERROR
 */
class UnknownLevelException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_UNKNOWN_LEVEL(...)                                              \
    throw otellogger::UnknownLevelException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                            ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Another export of the same transaction is still running
 */
class ExportInProgressException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_EXPORT_IN_PROGRESS(...)               \
    throw otellogger::ExportInProgressException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exporter backend reported an error during flush
 *
 * Thrown with std::throw_with_nested; the backend exception is available
 * through std::rethrow_if_nested.
 */
class ExporterFailureException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_NESTED_EXPORTER_FAILURE(...)                           \
    std::throw_with_nested(otellogger::ExporterFailureException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__))

/**
 * @brief Exporter backend could not write its output
 */
class ExporterIOException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_EXPORTER_IO_ERROR(...)                                        \
    throw otellogger::ExporterIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                          ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Base exception for malformed or missing configuration
 */
class ConfigurationException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_CONFIGURATION_ERROR(...)             \
    throw otellogger::ConfigurationException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Configuration file could not be read
 */
class ConfigIOException : public ConfigurationException {
    using ConfigurationException::ConfigurationException;
};

#define THROW_CONFIG_IO_ERROR(...)                                        \
    throw otellogger::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                        ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace otellogger

#endif  // OTELLOGGER_CORE_EXCEPTION_HPP
