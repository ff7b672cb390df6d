#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include "command_line.h"
#include "rearrange_digits.h"

static const std::string progname = "rearrange_digits";

struct ExampleCase {
    std::vector<int> digits;
    bool degenerate;
    std::string description;
};

static std::string format_digits(const std::vector<int>& digits) {
    std::string out = "[";
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(digits[i]);
    }
    return out + "]";
}

static bool run_examples() {
    const std::vector<ExampleCase> cases = {
        {{1, 2, 3, 4, 5}, false, "Basic case"},
        {{4, 6, 2, 5, 9, 8}, false, "Even length array"},
        {{}, true, "Empty array"},
        {{0}, true, "Single element"},
        {{0, 0}, false, "All zeros"},
        {{0, 0, 1, 1, 5, 5}, false, "Duplicate elements"},
        {{9, 8, 7, 6, 5, 4, 3, 2, 1, 0}, false, "All digits"},
        {{5, 5, 5, 5}, false, "All same digits"},
        {{1, 2}, false, "Minimum valid case"},
    };

    bool all_passed = true;
    for (size_t i = 0; i < cases.size(); ++i) {
        const ExampleCase& c = cases[i];
        rearrange::Partition result = rearrange::partition_for_max_sum(c.digits);
        const bool is_valid = rearrange::validate(c.digits, result);
        const std::uint64_t optimal = rearrange::reference_max_sum(c.digits);

        bool success = is_valid && result.sum() == optimal;
        if (c.degenerate) {
            success = success && result == rearrange::Partition{};
        }
        all_passed = all_passed && success;

        std::cout << "Test " << (i + 1) << ": " << (success ? "PASS" : "FAIL") << "\n"
                  << "  Description: " << c.description << "\n"
                  << "  Input: " << format_digits(c.digits) << "\n"
                  << "  Result: [" << result.first << ", " << result.second << "]\n"
                  << "  Sum: " << result.sum() << " (optimal: " << optimal << ")\n"
                  << "  Valid: " << (is_valid ? "true" : "false") << "\n\n";
    }
    return all_passed;
}

static void print_partition(const std::vector<int>& digits, bool as_split) {
    // Compute everything first so invalid input prints nothing on stdout
    if (as_split) {
        rearrange::DigitSplit split = rearrange::split_digits(digits);
        std::cout << "Input: " << format_digits(digits) << "\n"
                  << "First:  " << split.first << "\n"
                  << "Second: " << split.second << "\n";
        return;
    }

    rearrange::Partition result = rearrange::partition_for_max_sum(digits);
    const std::uint64_t optimal = rearrange::reference_max_sum(digits);
    const bool is_valid = rearrange::validate(digits, result);
    std::cout << "Input: " << format_digits(digits) << "\n"
              << "Result: [" << result.first << ", " << result.second << "]\n"
              << "Sum: " << result.sum() << " (optimal: " << optimal << ")\n"
              << "Valid: " << (is_valid ? "true" : "false") << "\n";
}

int main(int argc, char *argv[]) {
    po::variables_map vm;
    po::options_description opts("options");
    po::options_description hidden;
    po::options_description all;
    po::positional_options_description popts;

    opts.add_options()
        ("help,h", "print help message")
        ("explain,e", "print an explanation of the algorithm")
        ("examples,x", "run the built-in example cases")
        ("split,s", "print the two digit strings instead of integers (no length limit)")
    ;
    hidden.add_options()
        ("digits", po::value<std::vector<std::string>>(), "digits 0-9, separate or comma-separated")
    ;
    all.add(opts).add(hidden);
    popts.add("digits", -1);

    try {
        po::store(
            po::command_line_parser(rearrange::order_arguments(
                std::vector<std::string>(argv + 1, argv + argc)))
                .options(all)
                .positional(popts)
                .run(),
            vm
        );
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << progname << ": " << e.what() << "\n" << opts << "\n";
        return 2;
    }

    if (vm.count("help")) {
        std::cout << "usage: " << progname << " [options] <digit> [<digit> ...]\n"
                  << "example: " << progname << " 4,6,2,5,9,8\n"
                  << opts << "\n";
        return 0;
    }

    try {
        bool ok = true;
        if (vm.count("explain")) {
            std::cout << rearrange::explanation() << "\n";
        }
        if (vm.count("examples")) {
            ok = run_examples() && ok;
        }
        if (vm.count("digits")) {
            auto digits = rearrange::parse_digits(vm["digits"].as<std::vector<std::string>>());
            print_partition(digits, vm.count("split") > 0);
        } else if (!vm.count("explain") && !vm.count("examples")) {
            std::cerr << progname << ": no digits given (see --help)\n";
            return 2;
        }
        return ok ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
