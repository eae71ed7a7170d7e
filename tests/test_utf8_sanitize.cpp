// Tests for UTF-8 validation and repair of text bound for JSON strings.

#include "test_helpers.hpp"
#include "utils/utf8_sanitize.hpp"

#include <string>

using json = nlohmann::json;
using test_helpers::check;

namespace test_utf8_sanitize {

static const std::string kReplacement = "\xEF\xBF\xBD";

static bool test_valid_text_untouched() {
    std::string text = "plain ascii, caf\xC3\xA9, \xE2\x82\xAC, \xF0\x9F\x94\x8D";
    bool success = true;
    success &= check(utf8_sanitize::is_valid(text), "well-formed text is valid");
    success &= check(utf8_sanitize::sanitized(text) == text, "well-formed text is unchanged");
    return success;
}

static bool test_invalid_bytes_replaced() {
    bool success = true;
    success &= check(utf8_sanitize::sanitized("a\xFF" "b") == "a" + kReplacement + "b", "stray 0xFF is replaced");
    success &= check(utf8_sanitize::sanitized("\xC3") == kReplacement, "truncated sequence is replaced");
    success &= check(utf8_sanitize::sanitized("\xC0\xAF") == kReplacement + kReplacement, "overlong encoding is replaced");
    success &= check(utf8_sanitize::sanitized("\xED\xA0\x80") == kReplacement + kReplacement + kReplacement,
                     "UTF-16 surrogate is replaced");
    success &= check(!utf8_sanitize::is_valid("\xF4\x90\x80\x80"), "code points above U+10FFFF are invalid");
    return success;
}

// The point of the exercise: nlohmann::json can serialize the result.
static bool test_sanitized_text_serializes() {
    std::string text = "bad \xFE\xFF bytes";
    utf8_sanitize::sanitize(text);
    bool serialized = true;
    try {
        json value = text;
        (void)value.dump();
    } catch (const json::type_error &) {
        serialized = false;
    }
    return check(serialized, "sanitized text serializes without error");
}

static bool test_truncate_for_log() {
    bool success = true;
    success &= check(utf8_sanitize::truncate_for_log("short", 10) == "short", "short text is not cut");
    success &= check(utf8_sanitize::truncate_for_log("abcdefghij", 4) == "abcd...", "long text is cut with ellipsis");
    // "\xC3\xA9" is two bytes; cutting at 2 would split it.
    success &= check(utf8_sanitize::truncate_for_log("a\xC3\xA9z", 2) == "a...", "cut never splits a code point");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_valid_text_untouched();
    all_passed &= test_invalid_bytes_replaced();
    all_passed &= test_sanitized_text_serializes();
    all_passed &= test_truncate_for_log();
    return all_passed;
}

} // namespace test_utf8_sanitize
