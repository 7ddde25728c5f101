#include "obfuscator/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace obfuscator::utils {

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

auto remove_all(std::string_view s, char c) -> std::string {
    std::string result;
    result.reserve(s.size());
    for (char ch : s) {
        if (ch != c) result += ch;
    }
    return result;
}

} // namespace obfuscator::utils
