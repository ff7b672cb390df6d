#include "rearrange_digits.h"

#include <algorithm>
#include <functional>

namespace rearrange {

namespace {

std::string make_message(std::size_t index, int value) {
    return "element " + std::to_string(index) + " is " + std::to_string(value) +
           ", expected a single digit (0-9)";
}

void check_integer_capacity(std::size_t n) {
    if (n > kMaxIntegerDigits) {
        throw std::length_error("cannot form 64-bit numbers from " + std::to_string(n) +
                                " digits (limit " + std::to_string(kMaxIntegerDigits) + ")");
    }
}

// Caller guarantees at most 18 characters, all in '0'-'9'
std::uint64_t to_uint64(const std::string& digits) {
    std::uint64_t value = 0;
    for (char c : digits) {
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

// Add the digits of the decimal form of value; 0 contributes a single '0'
void add_decimal_digits(std::uint64_t value, DigitCounts& counts) {
    do {
        ++counts[value % 10];
        value /= 10;
    } while (value > 0);
}

} // anonymous namespace

InvalidInputError::InvalidInputError(std::size_t index, int value)
    : std::invalid_argument(make_message(index, value)), index_(index), value_(value) {}

DigitCounts count_digits(const std::vector<int>& digits) {
    DigitCounts counts{};
    for (std::size_t i = 0; i < digits.size(); ++i) {
        const int d = digits[i];
        if (d < 0 || d > 9) {
            throw InvalidInputError(i, d);
        }
        ++counts[d];
    }
    return counts;
}

DigitSplit split_digits(const std::vector<int>& digits) {
    DigitCounts counts = count_digits(digits);

    DigitSplit split;
    if (digits.size() < 2) return split;

    split.first.reserve((digits.size() + 1) / 2);
    split.second.reserve(digits.size() / 2);

    // Deal digits from largest to smallest, alternating between the two numbers
    bool use_first = true;
    for (int d = static_cast<int>(kRadix) - 1; d >= 0; --d) {
        const char c = static_cast<char>('0' + d);
        while (counts[d] > 0) {
            (use_first ? split.first : split.second).push_back(c);
            use_first = !use_first;
            --counts[d];
        }
    }
    return split;
}

Partition partition_for_max_sum(const std::vector<int>& digits) {
    // Range errors take precedence over the length limit
    (void)count_digits(digits);
    check_integer_capacity(digits.size());
    DigitSplit split = split_digits(digits);

    return Partition{to_uint64(split.first), to_uint64(split.second)};
}

bool validate(const std::vector<int>& original, const Partition& result) {
    if (original.size() <= 1) {
        return result == Partition{};
    }

    DigitCounts expected{};
    for (int d : original) {
        if (d < 0 || d > 9) return false;
        ++expected[d];
    }

    DigitCounts actual{};
    add_decimal_digits(result.first, actual);
    add_decimal_digits(result.second, actual);

    for (std::size_t d = 1; d < kRadix; ++d) {
        if (actual[d] != expected[d]) return false;
    }
    // Leading zeros disappear when a digit string is read as a number
    return actual[0] <= expected[0];
}

std::uint64_t reference_max_sum(const std::vector<int>& digits) {
    // Range check only; the sum below does not use the table
    (void)count_digits(digits);
    if (digits.size() < 2) return 0;
    check_integer_capacity(digits.size());

    std::vector<int> sorted = digits;
    std::sort(sorted.begin(), sorted.end(), std::greater<int>());

    std::uint64_t a = 0, b = 0;
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        if (i % 2 == 0) {
            a = a * 10 + static_cast<std::uint64_t>(sorted[i]);
        } else {
            b = b * 10 + static_cast<std::uint64_t>(sorted[i]);
        }
    }
    return a + b;
}

std::string explanation() {
    return R"(ALGORITHM

1. Counting sort, O(n)
   Count how often each digit 0-9 occurs in a fixed 10-bucket table.
   This yields the digits in sorted order without comparisons.

2. Greedy placement, O(n)
   Walk the digit values from 9 down to 0 and deal every occurrence
   alternately to the first and the second number, starting with the first.

3. Why it works
   A + B is largest when the largest digits sit in the most significant
   positions of both numbers and the two lengths differ by at most one.
   Swapping any two placed digits cannot increase the sum.

Example: [4, 6, 2, 5, 9, 8]
   sorted   : 9 8 6 5 4 2
   first    : 9 6 4 -> 964
   second   : 8 5 2 -> 852
   sum      : 1816 (maximum)

Time O(n), extra space O(1) beyond the two result numbers.
Empty and single-digit inputs give (0, 0).
)";
}

} // namespace rearrange
