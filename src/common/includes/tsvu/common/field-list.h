#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace tsvu::common {

/**
 * Parse a numeric field list such as "1,3-5,9-7".
 *
 * Fields are 1-based. Ranges expand in the direction written, so "3-1"
 * yields 3, 2, 1. Duplicates are kept in the order given.
 *
 * @param spec The field list text from the command line
 * @param allow_zero Whether field number 0 is accepted (a lone 0 is used by
 * some tools to mean "the whole line")
 * @return Field numbers in list order, 1-based (0 only if allow_zero)
 * @throws FieldListError if the list is empty or malformed
 */
std::vector<std::size_t>
parse_field_numbers(std::string_view spec, bool allow_zero = false);

/**
 * Pick fields out of a line, in the order of `indices`.
 *
 * Splitting stops as soon as the largest requested index has been seen, so
 * trailing fields are never scanned.
 *
 * @param line Line without its terminator
 * @param indices 0-based field indices
 * @param delimiter Field separator byte
 * @param out Receives one view per entry of `indices`; views point into
 * `line`
 * @return false if the line has fewer fields than the largest index needs
 */
bool
extract_fields(
    std::string_view line,
    const std::vector<std::size_t>& indices,
    char delimiter,
    std::vector<std::string_view>& out);

}  // namespace tsvu::common
