#pragma once

#include <snipvault/store/item.h>
#include <string_view>

namespace snipvault::store {

/**
 * @brief Guess the kind of a pasted value
 *
 * Detection order: URL scheme, filesystem path shape, code markers, then text.
 */
ContentKind detectContentKind(std::string_view content);

/**
 * @brief Check content against a declared kind
 * @return ValidationError with a readable message when the content does not fit
 */
Result<void> validateContent(ContentKind kind, std::string_view content);

} // namespace snipvault::store
