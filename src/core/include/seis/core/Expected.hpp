/**
 * @file Expected.hpp
 * @brief Result type of every fallible SeisLink operation.
 *
 * Transports, decoders and the ingestor never throw for expected failures
 * (a vanished device, a refused connection, a malformed unit).  They return
 * an Expected carrying a core::Error, and callers either handle it or hand
 * it up with SEIS_TRY.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SEIS_CORE_EXPECTED_HPP
    #define SEIS_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace seis::core {

/// @brief A value of type @p T, or the Error that prevented it.
template <typename T>
using Expected = std::expected<T, Error>;

/// @brief Outcome of an operation such as open(), close() or write().
using ExpectedVoid = Expected<void>;

} // namespace seis::core

/**
 * @brief Yields the value of @p expr, or returns its Error from the caller.
 *
 * A GNU statement expression, so it can sit on the right of an
 * initialisation:
 * @code
 *   auto lease = SEIS_TRY(stream.acquireReader());
 * @endcode
 * The enclosing function must itself return an Expected.
 */
#define SEIS_TRY(expr)                                                    \
    ({                                                                     \
        auto &&_seis_result = (expr);                                      \
        if (!_seis_result.has_value()) [[unlikely]]                        \
            return std::unexpected(std::move(_seis_result.error()));        \
        std::move(_seis_result.value());                                   \
    })

/// @brief Returns the Error of @p expr (an ExpectedVoid) from the caller.
#define SEIS_TRY_VOID(expr)                                               \
    do {                                                                    \
        auto &&_seis_result = (expr);                                      \
        if (!_seis_result.has_value()) [[unlikely]]                        \
            return std::unexpected(std::move(_seis_result.error()));        \
    } while (false)

#endif // SEIS_CORE_EXPECTED_HPP
