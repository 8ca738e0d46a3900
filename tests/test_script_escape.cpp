// Tests for escaping values interpolated into generated page scripts.
// A small JavaScript string-literal reader stands in for the page's parser so
// hostile inputs can be checked to come back out exactly as they went in.

#include "utils/script_escape.hpp"

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace test_script_escape {

// Read a single-quoted JS literal the way a JS engine would for the escapes quote() emits.
// Returns false if the literal is unterminated, ends early or contains a raw line break.
static bool read_js_literal(const std::string &literal, std::string &value) {
    value.clear();
    if (literal.size() < 2 || literal.front() != '\'' || literal.back() != '\'') {
        return false;
    }
    for (size_t index = 1; index + 1 < literal.size(); ++index) {
        char character = literal[index];
        if (character == '\'' || character == '\n' || character == '\r') {
            return false;
        }
        if (literal.compare(index, 3, "\xE2\x80\xA8") == 0 || literal.compare(index, 3, "\xE2\x80\xA9") == 0) {
            return false;
        }
        if (character != '\\') {
            value += character;
            continue;
        }
        if (index + 2 >= literal.size()) {
            return false;
        }
        char escape_code = literal[++index];
        switch (escape_code) {
        case '\\': value += '\\'; break;
        case '\'': value += '\''; break;
        case 'n': value += '\n'; break;
        case 'r': value += '\r'; break;
        case 't': value += '\t'; break;
        case 'b': value += '\b'; break;
        case 'f': value += '\f'; break;
        case 'x': {
            if (index + 2 >= literal.size()) return false;
            value += static_cast<char>(std::strtol(literal.substr(index + 1, 2).c_str(), nullptr, 16));
            index += 2;
            break;
        }
        case 'u': {
            if (index + 4 >= literal.size()) return false;
            std::string code = literal.substr(index + 1, 4);
            if (code == "2028") value += "\xE2\x80\xA8";
            else if (code == "2029") value += "\xE2\x80\xA9";
            else return false;
            index += 4;
            break;
        }
        default:
            return false;
        }
    }
    return true;
}

// Test: hostile selectors survive quoting unchanged and cannot close the literal.
static bool test_hostile_values_read_back_unchanged() {
    const std::vector<std::string> hostile_values = {
        "div.price",
        "a[href='x']",
        "');alert(1);('",
        "back\\slash\\'",
        "trailing backslash \\",
        "line\nbreak\r\nand\ttab",
        "nul\x01" "control\x1f and \x7f",
        "caf\xC3\xA9 \xE6\x97\xA5\xE6\x9C\xAC \xF0\x9F\x98\x80",
        "sep\xE2\x80\xA8line\xE2\x80\xA9para",
        "",
    };

    bool success = true;
    for (const auto &value : hostile_values) {
        std::string literal = script_escape::quote(value);
        std::string read_back;
        if (!read_js_literal(literal, read_back) || read_back != value) {
            std::cout << "  FAIL: value " << nlohmann::json(value).dump() << " quoted as " << literal
                      << std::endl;
            success = false;
        }
    }
    if (success) {
        std::cout << "  OK: " << hostile_values.size() << " hostile values quoted and read back unchanged"
                  << std::endl;
    }
    return success;
}

// Test: specific escapes are emitted as expected.
static bool test_specific_escapes() {
    struct Case {
        std::string input;
        std::string expected;
    };
    const std::vector<Case> cases = {
        {"it's", "it\\'s"},
        {"a\\b", "a\\\\b"},
        {"x\ny", "x\\ny"},
        {"\x01", "\\x01"},
        {"\xE2\x80\xA8", "\\u2028"},
        {"\"double\"", "\"double\""},
    };
    bool success = true;
    for (const auto &test_case : cases) {
        std::string escaped = script_escape::escape(test_case.input);
        if (escaped != test_case.expected) {
            std::cout << "  FAIL: escape(" << nlohmann::json(test_case.input).dump() << ") = " << escaped
                      << " (expected " << test_case.expected << ")" << std::endl;
            success = false;
        }
    }
    if (success) {
        std::cout << "  OK: Quote, backslash, newline, control and separator escapes" << std::endl;
    }
    return success;
}

// Test: invalid UTF-8 is replaced so the script can still be serialized to JSON.
static bool test_invalid_utf8_is_replaced() {
    std::string input = std::string("ok ") + "\xff" + " \xC3" + " \xE2\x80" + " end";
    std::string escaped = script_escape::escape(input);

    bool serializable = true;
    try {
        nlohmann::json params;
        params["expression"] = escaped;
        (void)params.dump();
    } catch (const nlohmann::json::type_error &) {
        serializable = false;
    }
    bool has_replacement = escaped.find("\xEF\xBF\xBD") != std::string::npos;
    bool keeps_text = escaped.find("ok ") == 0 && escaped.find(" end") != std::string::npos;

    bool success = serializable && has_replacement && keeps_text;
    if (success) {
        std::cout << "  OK: Invalid UTF-8 bytes replaced with U+FFFD" << std::endl;
    } else {
        std::cout << "  FAIL: serializable=" << serializable << " replacement=" << has_replacement
                  << " keeps_text=" << keeps_text << std::endl;
    }
    return success;
}

// Test: overlong forms, surrogates and code points past U+10FFFF are replaced, valid edges kept.
static bool test_malformed_multibyte_is_replaced() {
    struct Case {
        std::string input;
        bool keep;
    };
    const std::vector<Case> cases = {
        {"\xE0\x80\xAF", false},     // overlong '/'
        {"\xED\xA0\x80", false},     // lone high surrogate
        {"\xF0\x80\x80\xAF", false}, // overlong 4-byte
        {"\xF4\x90\x80\x80", false}, // U+110000
        {"\xE0\xA0\x80", true},      // U+0800
        {"\xED\x9F\xBF", true},      // U+D7FF
        {"\xF4\x8F\xBF\xBF", true},  // U+10FFFF
    };
    bool success = true;
    for (const auto &test_case : cases) {
        std::string escaped = script_escape::escape(test_case.input);
        bool serializable = true;
        try {
            nlohmann::json params;
            params["expression"] = escaped;
            (void)params.dump();
        } catch (const nlohmann::json::type_error &) {
            serializable = false;
        }
        bool replaced = escaped.find("\xEF\xBF\xBD") != std::string::npos;
        bool kept = escaped == test_case.input;
        if (!serializable || (test_case.keep ? !kept : !replaced)) {
            std::cout << "  FAIL: " << test_case.input.size() << "-byte input escaped to " << escaped.size() << " bytes, serializable=" << serializable
                      << std::endl;
            success = false;
        }
    }
    if (success) {
        std::cout << "  OK: Overlong, surrogate and out-of-range sequences replaced; boundary code points kept"
                  << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_hostile_values_read_back_unchanged();
    all_passed &= test_specific_escapes();
    all_passed &= test_invalid_utf8_is_replaced();
    all_passed &= test_malformed_multibyte_is_replaced();
    return all_passed;
}

} // namespace test_script_escape
