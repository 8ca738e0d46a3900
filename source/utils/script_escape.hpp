#ifndef PAGEPILOT_SCRIPT_ESCAPE_HPP
#define PAGEPILOT_SCRIPT_ESCAPE_HPP

// Escaping of values interpolated into generated page scripts.
// Every selector, attribute name or text that ends up inside an expression
// sent to Runtime.evaluate must go through quote().

#include <string>

namespace script_escape {

// Escapes text for use inside a single-quoted JavaScript string literal
// (without the surrounding quotes). Backslash, single quote, control characters,
// U+2028 and U+2029 are escaped; invalid UTF-8 bytes become U+FFFD so the
// expression can always be serialized as JSON.
std::string escape(const std::string &text);

// Returns escape(text) wrapped in single quotes.
std::string quote(const std::string &text);

} // namespace script_escape

#endif // PAGEPILOT_SCRIPT_ESCAPE_HPP
