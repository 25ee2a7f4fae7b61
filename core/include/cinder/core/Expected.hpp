/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * CINDER_TRY / CINDER_TRY_VOID macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef CINDER_CORE_EXPECTED_HPP
    #define CINDER_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace cinder::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace cinder::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type cinder::core::Expected<U>.
 */
#define CINDER_TRY(expr)                                                  \
    ({                                                                     \
        auto &&_cinder_result = (expr);                                    \
        if (!_cinder_result.has_value()) [[unlikely]]                      \
            return std::unexpected(std::move(_cinder_result.error()));      \
        std::move(_cinder_result.value());                                 \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type cinder::core::ExpectedVoid.
 */
#define CINDER_TRY_VOID(expr)                                             \
    do {                                                                    \
        auto &&_cinder_result = (expr);                                    \
        if (!_cinder_result.has_value()) [[unlikely]]                      \
            return std::unexpected(std::move(_cinder_result.error()));      \
    } while (false)

#endif // CINDER_CORE_EXPECTED_HPP
