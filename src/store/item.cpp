#include <snipvault/store/item.h>

#include "detail/string_utils.hpp"

namespace snipvault::store {

const char* contentKindToString(ContentKind kind) {
    switch (kind) {
        case ContentKind::Text:
            return "text";
        case ContentKind::Url:
            return "url";
        case ContentKind::Code:
            return "code";
        case ContentKind::Path:
            return "path";
    }
    return "text";
}

std::optional<ContentKind> contentKindFromString(std::string_view value) {
    const auto lowered = detail::asciiLower(detail::trimCopy(value));
    if (lowered == "text")
        return ContentKind::Text;
    if (lowered == "url")
        return ContentKind::Url;
    if (lowered == "code" || lowered == "command")
        return ContentKind::Code;
    if (lowered == "path")
        return ContentKind::Path;
    return std::nullopt;
}

int64_t toUnixSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromUnixSeconds(int64_t seconds) {
    return TimePoint(std::chrono::seconds(seconds));
}

int64_t nowUnixSeconds() {
    return toUnixSeconds(std::chrono::system_clock::now());
}

} // namespace snipvault::store
