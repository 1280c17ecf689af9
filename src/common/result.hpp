/*
 * result.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Result type for fallible operations

**************************************************/

#ifndef FIRETV_COMMON_RESULT_HPP
#define FIRETV_COMMON_RESULT_HPP

#include <expected>
#include <type_traits>

#include "error.hpp"
#include "exception.hpp"

namespace firetv {

/**
 * @brief Result type for session, protocol and configuration operations
 *
 * Uses std::expected to represent either a successful value or an Error.
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for operations with no return value
 */
using VoidResult = Result<void>;

/**
 * @brief Create a successful void result
 */
[[nodiscard]] inline auto success() -> VoidResult { return VoidResult(); }

/**
 * @brief Create a successful result
 */
template <typename T>
[[nodiscard]] inline auto success(T&& value) -> Result<std::decay_t<T>> {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

/**
 * @brief Create a failure result with error code and message
 */
[[nodiscard]] inline auto failure(ErrorCode code, const std::string& message)
    -> std::unexpected<Error> {
    return std::unexpected(Error(code, message));
}

/**
 * @brief Wrap an error for return from a Result-returning function
 */
[[nodiscard]] inline auto failure(Error error) -> std::unexpected<Error> {
    return std::unexpected(std::move(error));
}

/**
 * @brief Throw OperationException if result is an error
 */
template <typename T>
auto throwIfError(const Result<T>& result) -> void {
    if (!result) {
        throw OperationException(ATOM_FILE_NAME, ATOM_FILE_LINE,
                                 ATOM_FUNC_NAME, result.error());
    }
}

/**
 * @brief Get value or throw OperationException
 */
template <typename T>
[[nodiscard]] auto valueOrThrow(Result<T>&& result) -> T {
    throwIfError(result);
    return std::move(*result);
}

}  // namespace firetv

#endif  // FIRETV_COMMON_RESULT_HPP
