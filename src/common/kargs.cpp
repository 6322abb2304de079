#include "common/kargs.hpp"

namespace nodeos {

std::vector<std::string> quoteSpaceSplit(const std::string &text)
{
    std::vector<std::string> tokens;
    std::string current;
    bool quoted = false;

    for (const char ch : text) {
        if (ch == '"') {
            quoted = !quoted;
        }
        const bool separator = !quoted && (ch == ' ' || ch == '\n' || ch == '\t' || ch == '\r');
        if (separator) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
            continue;
        }
        current.push_back(ch);
    }

    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

std::vector<std::string> spaceSplit(const std::string &text)
{
    std::string trimmed = text;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }

    std::vector<std::string> tokens;
    std::string::size_type start = 0;
    while (true) {
        const auto space = trimmed.find(' ', start);
        if (space == std::string::npos) {
            tokens.push_back(trimmed.substr(start));
            break;
        }
        tokens.push_back(trimmed.substr(start, space - start));
        start = space + 1;
    }
    return tokens;
}

bool isKernelArgPresent(const std::vector<std::string> &active, const std::string &arg)
{
    for (const auto &value : active) {
        if (value.rfind(arg, 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace nodeos
