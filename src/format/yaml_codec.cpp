#include "obfuscator/format/yaml_codec.hpp"
#include "obfuscator/core/logger.hpp"
#include "obfuscator/core/utils.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <regex>

#include <yaml-cpp/yaml.h>

namespace obfuscator::format {

namespace {

auto is_null_text(std::string_view s) -> bool {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

auto resolve_bool(std::string_view s) -> std::optional<bool> {
    static constexpr std::string_view truthy[] = {
        "true", "True", "TRUE", "yes", "Yes", "YES", "on", "On", "ON",
    };
    static constexpr std::string_view falsy[] = {
        "false", "False", "FALSE", "no", "No", "NO", "off", "Off", "OFF",
    };
    for (auto t : truthy) {
        if (s == t) return true;
    }
    for (auto f : falsy) {
        if (s == f) return false;
    }
    return std::nullopt;
}

/// Integer forms: [sign] then 0x.., 0o.., 0b.., 0[0-7]+ (YAML 1.1 octal)
/// or plain decimal. Underscores are digit separators.
auto resolve_int(std::string_view s) -> std::optional<Document> {
    static const std::regex decimal_re(R"(^[-+]?(0|[1-9][0-9_]*)$)");
    static const std::regex hex_re(R"(^[-+]?0x[0-9a-fA-F_]+$)");
    static const std::regex octal_re(R"(^[-+]?0o?[0-7_]+$)");
    static const std::regex binary_re(R"(^[-+]?0b[01_]+$)");

    std::string text(s);
    int base = 0;
    size_t prefix = 0;
    if (std::regex_match(text, decimal_re)) {
        base = 10;
    } else if (std::regex_match(text, hex_re)) {
        base = 16;
        prefix = 2;
    } else if (std::regex_match(text, binary_re)) {
        base = 2;
        prefix = 2;
    } else if (std::regex_match(text, octal_re)) {
        base = 8;
        prefix = (text.find('o') != std::string::npos) ? 2 : 1;
    } else {
        return std::nullopt;
    }

    bool negative = false;
    std::string_view body(text);
    if (body.front() == '-' || body.front() == '+') {
        negative = body.front() == '-';
        body.remove_prefix(1);
    }
    body.remove_prefix(prefix);
    auto digits = utils::remove_all(body, '_');
    if (digits.empty()) {
        return std::nullopt;
    }

    std::uint64_t magnitude = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude, base);
    if (ec == std::errc::result_out_of_range) {
        if (base != 10) return std::nullopt;
        double value = std::strtod(digits.c_str(), nullptr);
        return Document(negative ? -value : value);
    }
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }

    constexpr auto int64_max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (negative) {
        if (magnitude <= int64_max) {
            return Document(-static_cast<std::int64_t>(magnitude));
        }
        if (magnitude == int64_max + 1) {
            return Document(std::numeric_limits<std::int64_t>::min());
        }
        return Document(-static_cast<double>(magnitude));
    }
    if (magnitude <= int64_max) {
        return Document(static_cast<std::int64_t>(magnitude));
    }
    return Document(magnitude);
}

auto resolve_float(std::string_view s) -> std::optional<Document> {
    static const std::regex float_re(
        R"(^[-+]?(\.[0-9][0-9_]*|[0-9][0-9_]*(\.[0-9_]*)?)([eE][-+]?[0-9]+)?$)");
    static const std::regex inf_re(R"(^[-+]?\.(inf|Inf|INF)$)");
    static const std::regex nan_re(R"(^\.(nan|NaN|NAN)$)");

    std::string text(s);
    if (std::regex_match(text, inf_re)) {
        double inf = std::numeric_limits<double>::infinity();
        return Document(text.front() == '-' ? -inf : inf);
    }
    if (std::regex_match(text, nan_re)) {
        return Document(std::numeric_limits<double>::quiet_NaN());
    }
    // A float needs a fraction or an exponent; bare digits are integers
    // or, like "08", plain strings.
    if (text.find_first_of(".eE") == std::string::npos || !std::regex_match(text, float_re)) {
        return std::nullopt;
    }
    auto cleaned = utils::remove_all(text, '_');
    return Document(std::strtod(cleaned.c_str(), nullptr));
}

auto is_string_tag(const std::string& tag) -> bool {
    // yaml-cpp tags quoted scalars with "!" and plain ones with "?".
    return tag == "!" || tag == "tag:yaml.org,2002:str";
}

// Aliases are expanded into copies, so a small stream of nested anchors
// can describe an enormous tree. Conversion is capped at this many nodes
// per input byte, with a floor for short documents.
constexpr std::size_t kNodesPerInputByte = 64;
constexpr std::size_t kMinNodeBudget = 65536;

auto to_document(const YAML::Node& node, std::size_t& budget) -> Result<Document> {
    if (budget == 0) {
        return std::unexpected(make_error(
            ErrorCode::UnrecognizedFormat,
            "Invalid YAML",
            "alias expansion limit exceeded"));
    }
    --budget;

    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Document(nullptr);

        case YAML::NodeType::Scalar:
            if (is_string_tag(node.Tag())) {
                return Document(node.Scalar());
            }
            return resolve_plain_scalar(node.Scalar());

        case YAML::NodeType::Sequence: {
            Document seq = Document::array();
            for (const auto& item : node) {
                auto converted = to_document(item, budget);
                if (!converted) {
                    return std::unexpected(converted.error());
                }
                seq.push_back(std::move(*converted));
            }
            return seq;
        }

        case YAML::NodeType::Map: {
            Document map = Document::object();
            for (const auto& entry : node) {
                std::string key;
                if (entry.first.IsScalar()) {
                    key = entry.first.Scalar();
                } else if (entry.first.IsNull()) {
                    key = "null";
                } else {
                    return std::unexpected(make_error(
                        ErrorCode::UnrecognizedFormat,
                        "Unsupported mapping key",
                        "keys must be scalars, found a collection at line " +
                            std::to_string(entry.first.Mark().line + 1)));
                }
                auto converted = to_document(entry.second, budget);
                if (!converted) {
                    return std::unexpected(converted.error());
                }
                map[key] = std::move(*converted);
            }
            return map;
        }
    }
    return Document(nullptr);
}

auto needs_quotes(const std::string& s) -> bool {
    return !resolve_plain_scalar(s).is_string();
}

void emit_string(YAML::Emitter& out, const std::string& s) {
    if (needs_quotes(s)) {
        out << YAML::DoubleQuoted;
    }
    out << s;
}

void emit_node(YAML::Emitter& out, const Document& node) {
    switch (node.type()) {
        case Document::value_t::object:
            out << YAML::BeginMap;
            for (auto it = node.begin(); it != node.end(); ++it) {
                out << YAML::Key;
                emit_string(out, it.key());
                out << YAML::Value;
                emit_node(out, *it);
            }
            out << YAML::EndMap;
            break;

        case Document::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& item : node) {
                emit_node(out, item);
            }
            out << YAML::EndSeq;
            break;

        case Document::value_t::string:
            emit_string(out, node.get_ref<const std::string&>());
            break;

        case Document::value_t::boolean:
            out << node.get<bool>();
            break;

        case Document::value_t::number_float: {
            double value = node.get<double>();
            if (std::isnan(value)) {
                out << ".nan";
            } else if (std::isinf(value)) {
                out << (value < 0 ? "-.inf" : ".inf");
            } else {
                out << node.dump();
            }
            break;
        }

        case Document::value_t::number_integer:
        case Document::value_t::number_unsigned:
            out << node.dump();
            break;

        case Document::value_t::null:
        case Document::value_t::discarded:
        case Document::value_t::binary:
        default:
            out << YAML::Null;
            break;
    }
}

} // anonymous namespace

auto resolve_plain_scalar(std::string_view text) -> Document {
    if (is_null_text(text)) {
        return Document(nullptr);
    }
    if (auto b = resolve_bool(text)) {
        return Document(*b);
    }
    if (auto i = resolve_int(text)) {
        return std::move(*i);
    }
    if (auto f = resolve_float(text)) {
        return std::move(*f);
    }
    return Document(std::string(text));
}

auto parse_yaml(std::string_view text) -> Result<Document> {
    std::vector<YAML::Node> docs;
    try {
        docs = YAML::LoadAll(std::string(text));
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(
            ErrorCode::UnrecognizedFormat, "Invalid YAML", e.what()));
    }

    if (docs.empty()) {
        return Document(nullptr);
    }
    if (docs.size() > 1) {
        return std::unexpected(make_error(
            ErrorCode::UnrecognizedFormat,
            "Invalid YAML",
            "expected a single document, found " + std::to_string(docs.size())));
    }

    std::size_t budget = std::max(text.size() * kNodesPerInputByte, kMinNodeBudget);
    try {
        return to_document(docs.front(), budget);
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(
            ErrorCode::UnrecognizedFormat, "Invalid YAML", e.what()));
    }
}

auto emit_yaml(const Document& doc) -> Result<std::string> {
    YAML::Emitter out;
    out.SetIndent(2);

    emit_node(out, doc);

    if (!out.good()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            "Failed to emit YAML",
            out.GetLastError()));
    }

    std::string text(out.c_str(), out.size());
    text += '\n';
    LOG_TRACE("Emitted {} bytes of YAML", text.size());
    return text;
}

} // namespace obfuscator::format
