#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace rearrange {

// Number of distinct decimal digit values
constexpr std::size_t kRadix = 10;

// Longest input accepted by the integer interface: both numbers get at most
// 18 digits, so each of them and their sum fit in std::uint64_t
constexpr std::size_t kMaxIntegerDigits = 36;

// Occurrences of each digit value 0-9
using DigitCounts = std::array<std::size_t, kRadix>;

/**
 * @brief Thrown when an input element is not a single decimal digit
 */
class InvalidInputError : public std::invalid_argument {
public:
    InvalidInputError(std::size_t index, int value);

    std::size_t index() const { return index_; }
    int value() const { return value_; }

private:
    std::size_t index_;
    int value_;
};

/**
 * @brief Two numbers built from a digit sequence
 */
struct Partition {
    std::uint64_t first = 0;
    std::uint64_t second = 0;

    std::uint64_t sum() const { return first + second; }

    bool operator==(const Partition& other) const {
        return first == other.first && second == other.second;
    }
    bool operator!=(const Partition& other) const { return !(*this == other); }
};

/**
 * @brief The same partition as digit strings, most significant digit first
 *
 * Leading zeros are kept, so first + second is always a permutation of the input.
 */
struct DigitSplit {
    std::string first;
    std::string second;
};

// Count occurrences of each digit, throwing InvalidInputError on the first
// element outside [0, 9]
DigitCounts count_digits(const std::vector<int>& digits);

/**
 * @brief Split digits into two strings whose numeric sum is maximal
 *
 * Digits are taken from 9 down to 0 and dealt alternately to the first and
 * second string, starting with the first. Runs in O(n) with a fixed 10-bucket
 * table and has no length limit.
 *
 * @param digits Sequence of values in [0, 9]
 * @return Both strings empty when digits has fewer than two elements
 * @throws InvalidInputError if any element is outside [0, 9]
 */
DigitSplit split_digits(const std::vector<int>& digits);

/**
 * @brief Rearrange digits into two numbers with the maximum possible sum
 *
 * Example: {4, 6, 2, 5, 9, 8} -> (964, 852), sum 1816.
 *
 * @param digits Sequence of values in [0, 9], at most kMaxIntegerDigits long
 * @return (0, 0) for an empty or single-element sequence
 * @throws InvalidInputError if any element is outside [0, 9]
 * @throws std::length_error if digits has more than kMaxIntegerDigits elements
 */
Partition partition_for_max_sum(const std::vector<int>& digits);

// Check that result uses exactly the digits of original. Only leading zeros
// may be missing from the decimal forms of the two numbers. Never throws.
bool validate(const std::vector<int>& original, const Partition& result);

// Independent maximum-sum oracle: std::sort descending, then alternate.
// Returns 0 for fewer than two digits.
std::uint64_t reference_max_sum(const std::vector<int>& digits);

// Human-readable description of the algorithm
std::string explanation();

} // namespace rearrange
