#include "utils/script_escape.hpp"

#include <cstdint>
#include <cstdio>

namespace script_escape {

namespace {

const char kReplacementUtf8[] = "\xEF\xBF\xBD"; // U+FFFD

// Returns number of bytes that form a valid UTF-8 lead byte (1-4), or 0 if invalid.
size_t utf8_lead_length(unsigned char byte) {
    if (byte < 0x80u) {
        return 1;
    }
    if (byte >= 0xC2u && byte <= 0xDFu) {
        return 2;
    }
    if (byte >= 0xE0u && byte <= 0xEFu) {
        return 3;
    }
    if (byte >= 0xF0u && byte <= 0xF4u) {
        return 4;
    }
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

// Allowed range of the byte after a lead byte (RFC 3629): rules out overlong
// forms, UTF-16 surrogates and code points above U+10FFFF.
bool second_byte_allowed(unsigned char lead, unsigned char byte) {
    switch (lead) {
    case 0xE0u:
        return byte >= 0xA0u && byte <= 0xBFu;
    case 0xEDu:
        return byte >= 0x80u && byte <= 0x9Fu;
    case 0xF0u:
        return byte >= 0x90u && byte <= 0xBFu;
    case 0xF4u:
        return byte >= 0x80u && byte <= 0x8Fu;
    default:
        return is_continuation(byte);
    }
}

void append_ascii(std::string &output, unsigned char character) {
    switch (character) {
    case '\\':
        output += "\\\\";
        return;
    case '\'':
        output += "\\'";
        return;
    case '\n':
        output += "\\n";
        return;
    case '\r':
        output += "\\r";
        return;
    case '\t':
        output += "\\t";
        return;
    case '\b':
        output += "\\b";
        return;
    case '\f':
        output += "\\f";
        return;
    default:
        break;
    }
    if (character < 0x20u || character == 0x7Fu) {
        char hex_buffer[5];
        std::snprintf(hex_buffer, sizeof(hex_buffer), "\\x%02x", static_cast<unsigned int>(character));
        output += hex_buffer;
        return;
    }
    output += static_cast<char>(character);
}

} // namespace

std::string escape(const std::string &text) {
    std::string output;
    output.reserve(text.size() + 8);

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        size_t length = utf8_lead_length(*pointer);

        if (length == 1) {
            append_ascii(output, *pointer);
            ++pointer;
            continue;
        }

        bool valid = (length != 0) && (pointer + length <= end) && second_byte_allowed(pointer[0], pointer[1]);
        for (size_t index = 2; valid && index < length; ++index) {
            valid = is_continuation(pointer[index]);
        }
        if (!valid) {
            output += kReplacementUtf8;
            ++pointer;
            continue;
        }

        // U+2028 LINE SEPARATOR and U+2029 PARAGRAPH SEPARATOR end a line in older engines.
        if (length == 3 && pointer[0] == 0xE2u && pointer[1] == 0x80u &&
            (pointer[2] == 0xA8u || pointer[2] == 0xA9u)) {
            output += (pointer[2] == 0xA8u) ? "\\u2028" : "\\u2029";
        } else {
            output.append(reinterpret_cast<const char *>(pointer), length);
        }
        pointer += length;
    }

    return output;
}

std::string quote(const std::string &text) {
    return "'" + escape(text) + "'";
}

} // namespace script_escape
