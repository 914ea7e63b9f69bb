#pragma once

/**
 * @file result_helpers.hpp
 * @brief Early-return macros for Result<T>
 *
 * The TRY macros behave like Rust's ? operator: evaluate, and on error
 * return the error from the enclosing function.
 */

#include <snipvault/core/types.h>

#include <utility>

namespace snipvault::store::detail {

/**
 * @def SNIPVAULT_TRY(expr)
 * @brief Evaluate expression and return early if it's an error
 *
 * @code
 * Result<void> doWork() {
 *     SNIPVAULT_TRY(step1());
 *     SNIPVAULT_TRY(step2());
 *     return {};
 * }
 * @endcode
 */
#define SNIPVAULT_TRY(expr)                                                                        \
    do {                                                                                           \
        auto _sv_try_result = (expr);                                                              \
        if (!_sv_try_result.has_value()) {                                                         \
            return _sv_try_result.error();                                                         \
        }                                                                                          \
    } while (0)

/**
 * @def SNIPVAULT_TRY_UNWRAP(var, expr)
 * @brief Declare and initialize variable from Result, returning error if failed
 *
 * @code
 * Result<int> count(Database& db) {
 *     SNIPVAULT_TRY_UNWRAP(stmt, db.prepare(sql));
 *     SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
 *     return hasRow ? stmt.getInt(0) : 0;
 * }
 * @endcode
 *
 * @note Introduces two names in the current scope; not usable as the single
 *       statement of an unbraced if/for body.
 */
#define SNIPVAULT_TRY_UNWRAP(var, expr)                                                            \
    auto _sv_res_##var = (expr);                                                                   \
    if (!_sv_res_##var.has_value()) {                                                              \
        return _sv_res_##var.error();                                                              \
    }                                                                                              \
    auto var = std::move(_sv_res_##var).value()

} // namespace snipvault::store::detail
