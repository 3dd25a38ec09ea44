#pragma once

#include <string>

namespace codegate {

// Scrubs an error message before it leaves the service: absolute paths
// become <path>, hex addresses become <address>, credential-looking values
// become <redacted>, and the text is capped at MAX_ERROR_MESSAGE_LENGTH.
std::string sanitize_error_message(const std::string& message);

// Cuts text to at most limit bytes on a UTF-8 boundary, ending in "..."
std::string clip_message(const std::string& text, size_t limit);

} // namespace codegate
