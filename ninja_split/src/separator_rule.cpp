#include <ninja_split/separator_rule.hpp>

namespace ninja_split {

bool ninja_separator(uint8_t previous, uint8_t current, uint8_t next) {
    return current == '\n' && previous != '$' && next != ' ' && next != '\t';
}

bool line_break_separator(uint8_t /*previous*/, uint8_t current, uint8_t /*next*/) {
    return current == '\n';
}

} // namespace ninja_split
