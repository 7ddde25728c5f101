#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace obfuscator::utils {

auto to_lower(std::string_view s) -> std::string;
auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;
auto remove_all(std::string_view s, char c) -> std::string;

} // namespace obfuscator::utils
