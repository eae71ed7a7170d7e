#ifndef TMCPS_UTF8_SANITIZE_HPP
#define TMCPS_UTF8_SANITIZE_HPP

// UTF-8 hygiene for text that ends up inside JSON strings.
// nlohmann::json::dump() throws on invalid UTF-8, so anything that did not come
// out of the JSON parser (exception text, parser diagnostics, raw frames quoted
// in logs) goes through here first.

#include <cstddef>
#include <string>

namespace utf8_sanitize {

// True if text is well-formed UTF-8 (no overlongs, no surrogates, max U+10FFFF).
bool is_valid(const std::string &text);

// Replaces each ill-formed sequence with U+FFFD. In-place version.
void sanitize(std::string &text);

// Returns a sanitized copy.
std::string sanitized(const std::string &text);

// Sanitized copy cut to at most max_bytes without splitting a code point;
// appends "..." when something was cut. For quoting wire text in log lines.
std::string truncate_for_log(const std::string &text, std::size_t max_bytes);

} // namespace utf8_sanitize

#endif // TMCPS_UTF8_SANITIZE_HPP
