#include <snipvault/store/content_kind.h>

#include <array>
#include <regex>

#include "detail/string_utils.hpp"

namespace snipvault::store {

namespace {

constexpr std::array<std::string_view, 4> kUrlSchemes = {"http://", "https://", "ftp://",
                                                         "www."};

constexpr std::array<std::string_view, 32> kCodePrefixes = {
    "git ",   "docker ", "npm ",    "pip ",    "python ",  "node ",   "cd ",     "mkdir ",
    "chmod ", "chown ",  "ls ",     "cat ",    "#!/",      "def ",    "class ",  "import ",
    "from ",  "export ", "function", "const ", "let ",     "var ",    "async ",  "await ",
    "<?php",  "select ", "insert ", "update ", "delete ",  "create ", "drop ",   "alter "};

const std::regex& windowsDriveRegex() {
    static const std::regex re(R"(^[A-Za-z]:\\)");
    return re;
}

const std::regex& fileExtensionRegex() {
    static const std::regex re(
        R"(\.(exe|dll|py|js|ts|jsx|tsx|java|cpp|hpp|h|cs|go|rs|rb|php|html|css|json|xml|yml|yaml|toml|md|txt|pdf|docx?|xlsx?|pptx?|zip|rar|tar|gz|7z|png|jpe?g|gif|svg|mp4|mp3|avi|mov)$)",
        std::regex::icase);
    return re;
}

const std::regex& codeSyntaxRegex() {
    // assignment, brackets, trailing semicolon, arrows, scope, sigils, decorators
    static const std::regex re(R"(\s=\s|[{}\[\]()]|;$|=>|->|::\w|\$\w|@\w)");
    return re;
}

const std::regex& urlRegex() {
    static const std::regex re(R"(^(https?|ftp)://[^\s/$.?#][^\s]*$)", std::regex::icase);
    return re;
}

} // namespace

ContentKind detectContentKind(std::string_view content) {
    const auto trimmed = detail::trimCopy(content);
    if (trimmed.empty()) {
        return ContentKind::Text;
    }

    const auto lowered = detail::asciiLower(trimmed);
    for (auto scheme : kUrlSchemes) {
        if (detail::startsWith(lowered, scheme)) {
            return ContentKind::Url;
        }
    }

    if (std::regex_search(trimmed, windowsDriveRegex()) || detail::startsWith(trimmed, "/") ||
        detail::startsWith(trimmed, "~/") || detail::startsWith(trimmed, "./")) {
        return ContentKind::Path;
    }
    if (trimmed.find(' ') == std::string::npos &&
        std::regex_search(trimmed, fileExtensionRegex())) {
        return ContentKind::Path;
    }

    for (auto prefix : kCodePrefixes) {
        if (detail::startsWith(lowered, prefix)) {
            return ContentKind::Code;
        }
    }
    if (std::regex_search(trimmed, codeSyntaxRegex())) {
        return ContentKind::Code;
    }

    return ContentKind::Text;
}

Result<void> validateContent(ContentKind kind, std::string_view content) {
    const auto trimmed = detail::trimCopy(content);
    if (trimmed.empty()) {
        return Error{ErrorCode::ValidationError,
                     std::string(contentKindToString(kind)) + " content must not be empty"};
    }

    switch (kind) {
        case ContentKind::Url:
            if (!std::regex_match(trimmed, urlRegex())) {
                return Error{ErrorCode::ValidationError,
                             "URL must start with http://, https:// or ftp:// and name a host"};
            }
            break;
        case ContentKind::Path:
            if (trimmed.find('\0') != std::string::npos) {
                return Error{ErrorCode::ValidationError, "Path contains a NUL character"};
            }
            break;
        case ContentKind::Code:
        case ContentKind::Text:
            break;
    }
    return {};
}

} // namespace snipvault::store
