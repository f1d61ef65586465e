#ifndef NINJA_SPLIT_SEPARATOR_RULE_HPP
#define NINJA_SPLIT_SEPARATOR_RULE_HPP

#include <cstdint>
#include <functional>

namespace ninja_split {

/**
 * Decides whether a declaration boundary follows `current`.
 * Called with every window of three consecutive bytes; must be pure and safe
 * to call from several threads at once.
 */
using SeparatorRule = std::function<bool(uint8_t previous, uint8_t current, uint8_t next)>;

/**
 * Ninja statement separator: a newline that is not escaped with '$' and is
 * not followed by indentation. Indented lines (variable bindings of a rule or
 * build statement) belong to the preceding statement.
 */
bool ninja_separator(uint8_t previous, uint8_t current, uint8_t next);

// Boundary after every '\n'
bool line_break_separator(uint8_t previous, uint8_t current, uint8_t next);

} // namespace ninja_split

#endif // NINJA_SPLIT_SEPARATOR_RULE_HPP
