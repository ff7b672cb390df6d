#include "command_line.h"

#include <cctype>
#include <stdexcept>

namespace rearrange {

namespace {

int to_int(const std::string& token) {
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(token, &used);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("not a number: '" + token + "'");
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("not a number: '" + token + "'");
    }
    if (used != token.size()) {
        throw std::invalid_argument("not a number: '" + token + "'");
    }
    return value;
}

bool looks_like_negative_number(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-' && std::isdigit(static_cast<unsigned char>(arg[1]));
}

} // anonymous namespace

std::vector<int> parse_digits(const std::vector<std::string>& args) {
    std::vector<int> digits;
    for (const auto& arg : args) {
        size_t start = 0;
        while (start <= arg.size()) {
            size_t end = arg.find(',', start);
            if (end == std::string::npos) end = arg.size();
            std::string token = arg.substr(start, end - start);
            if (!token.empty()) {
                digits.push_back(to_int(token));
            }
            start = end + 1;
        }
    }
    return digits;
}

std::vector<std::string> order_arguments(const std::vector<std::string>& args) {
    std::vector<std::string> options;
    std::vector<std::string> positionals;

    bool after_separator = false;
    for (const auto& arg : args) {
        if (after_separator) {
            positionals.push_back(arg);
        } else if (arg == "--") {
            after_separator = true;
        } else if (arg.size() > 1 && arg[0] == '-' && !looks_like_negative_number(arg)) {
            options.push_back(arg);
        } else {
            positionals.push_back(arg);
        }
    }

    // No option takes a value, so everything else is a digit argument
    options.push_back("--");
    options.insert(options.end(), positionals.begin(), positionals.end());
    return options;
}

} // namespace rearrange
