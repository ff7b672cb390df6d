#pragma once

#include <string>
#include <vector>

namespace rearrange {

// Parse digit arguments, each either one number or a comma-separated list
// ("4,6,2" or "4" "6" "2"). Empty items are skipped. Range is not checked here.
// Throws std::invalid_argument for a token that is not a whole int.
std::vector<int> parse_digits(const std::vector<std::string>& args);

// Reorder command-line arguments (without the program name) so every digit
// argument comes after a single "--", keeping their relative order.
// Tokens like "-1" or "-1,5" are digits, not short options.
std::vector<std::string> order_arguments(const std::vector<std::string>& args);

} // namespace rearrange
