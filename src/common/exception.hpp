/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Exceptions used at module boundaries that still throw

**************************************************/

#ifndef FIRETV_COMMON_EXCEPTION_HPP
#define FIRETV_COMMON_EXCEPTION_HPP

#include "atom/error/exception.hpp"

#include "error.hpp"

namespace firetv {

/**
 * @brief Exception thrown while reading or validating a configuration file
 *
 * Only raised inside the loader; callers receive a ParseError result.
 */
class ConfigParseException : public atom::error::Exception {
    using Exception::Exception;
};

#define THROW_CONFIG_PARSE_ERROR(...)                                       \
    throw firetv::ConfigParseException(ATOM_FILE_NAME, ATOM_FILE_LINE,      \
                                       ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception thrown for malformed command line arguments
 */
class CommandLineException : public atom::error::Exception {
    using Exception::Exception;
};

#define THROW_COMMAND_LINE_ERROR(...)                                       \
    throw firetv::CommandLineException(ATOM_FILE_NAME, ATOM_FILE_LINE,      \
                                       ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception carrying an Error out of a Result
 */
class OperationException : public atom::error::Exception {
public:
    OperationException(const char* file, int line, const char* func,
                       Error error)
        : Exception(file, line, func, error.toString()),
          error_(std::move(error)) {}

    [[nodiscard]] auto error() const noexcept -> const Error& {
        return error_;
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return error_.code;
    }

private:
    Error error_;
};

}  // namespace firetv

#endif  // FIRETV_COMMON_EXCEPTION_HPP
