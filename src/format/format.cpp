#include "obfuscator/format/format.hpp"
#include "obfuscator/core/utils.hpp"

namespace obfuscator::format {

auto format_for_path(const std::filesystem::path& path) -> std::optional<Format> {
    auto ext = utils::to_lower(path.extension().string());
    if (ext == ".yaml" || ext == ".yml") return Format::Yaml;
    if (ext == ".json") return Format::Json;
    return std::nullopt;
}

} // namespace obfuscator::format
