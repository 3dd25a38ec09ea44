#include "sanitize.h"
#include "codegate/constants.h"
#include <regex>

namespace codegate {

namespace {

const std::regex& address_pattern() {
    static const std::regex pattern(R"(0x[0-9a-fA-F]{4,})");
    return pattern;
}

// Absolute paths of two or more components ("/usr/lib", "/home/u/.aws/x")
const std::regex& path_pattern() {
    static const std::regex pattern(R"((^|[\s'"(=:])(/[A-Za-z0-9._-]+){2,}/?)");
    return pattern;
}

const std::regex& access_key_pattern() {
    static const std::regex pattern(R"((AKIA|ASIA)[0-9A-Z]{16})");
    return pattern;
}

const std::regex& secret_assignment_pattern() {
    static const std::regex pattern(
        R"(((secret|token|password|passwd|credential)[A-Za-z_]*\s*[=:]\s*)['"]?[^\s'",;]+['"]?)",
        std::regex::icase);
    return pattern;
}

// Keeps a truncated message valid UTF-8
size_t utf8_boundary(const std::string& text, size_t limit) {
    while (limit > 0 && (static_cast<unsigned char>(text[limit]) & 0xC0) == 0x80) {
        --limit;
    }
    return limit;
}

} // namespace

std::string clip_message(const std::string& text, size_t limit) {
    const std::string ellipsis = "...";
    if (text.size() <= limit || limit < ellipsis.size()) {
        return text.size() <= limit ? text : text.substr(0, limit);
    }
    size_t cut = utf8_boundary(text, limit - ellipsis.size());
    return text.substr(0, cut) + ellipsis;
}

std::string sanitize_error_message(const std::string& message) {
    // std::regex recurses per matched character; long input would exhaust the stack
    std::string text = clip_message(message, MAX_RAW_ERROR_LENGTH);

    text = std::regex_replace(text, secret_assignment_pattern(), "$1<redacted>");
    text = std::regex_replace(text, access_key_pattern(), "<redacted>");
    text = std::regex_replace(text, address_pattern(), "<address>");
    text = std::regex_replace(text, path_pattern(), "$1<path>");

    return clip_message(text, MAX_ERROR_MESSAGE_LENGTH);
}

} // namespace codegate
