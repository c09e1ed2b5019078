#include "datatypes.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <cctype>
#include <stdexcept>

namespace core {

namespace {

    // One step of a getAttr path: either a field name or an array index
    struct PathStep {
        bool is_index = false;
        std::string key;
        std::size_t index = 0;
    };

    std::vector<PathStep> parsePath(const std::string& path) {
        std::vector<PathStep> steps;
        if (path.empty()) {
            throw std::invalid_argument("getAttr path cannot be empty");
        }
        for (const auto& segment : utils::split(path, '.')) {
            std::string::size_type bracket = segment.find('[');
            std::string key = segment.substr(0, bracket);
            if (key.empty() && bracket == std::string::npos) {
                throw std::invalid_argument(fmt::format("Empty segment in getAttr path '{}'", path));
            }
            if (!key.empty()) {
                PathStep step;
                step.key = key;
                steps.push_back(step);
            }
            while (bracket != std::string::npos) {
                std::string::size_type close = segment.find(']', bracket);
                if (close == std::string::npos || close == bracket + 1) {
                    throw std::invalid_argument(fmt::format("Malformed index in getAttr path '{}'", path));
                }
                std::string digits = segment.substr(bracket + 1, close - bracket - 1);
                for (char c : digits) {
                    if (!std::isdigit(static_cast<unsigned char>(c))) {
                        throw std::invalid_argument(fmt::format("Non-numeric index '{}' in getAttr path '{}'", digits, path));
                    }
                }
                PathStep step;
                step.is_index = true;
                try {
                    step.index = static_cast<std::size_t>(std::stoull(digits));
                } catch (const std::out_of_range&) {
                    throw std::invalid_argument(fmt::format("Index '{}' is out of range in getAttr path '{}'", digits, path));
                }
                steps.push_back(step);
                bracket = close + 1 < segment.size() ? close + 1 : std::string::npos;
                if (bracket != std::string::npos && segment[bracket] != '[') {
                    throw std::invalid_argument(fmt::format("Unexpected text after index in getAttr path '{}'", path));
                }
            }
        }
        return steps;
    }

    OptionalValue field(const Value& target, const std::string& key) {
        if (const auto* arn = std::get_if<Arn>(&target)) {
            if (key == "partition") return Value(arn->partition);
            if (key == "service") return Value(arn->service);
            if (key == "region") return Value(arn->region);
            if (key == "accountId") return Value(arn->account_id);
            if (key == "resourceId") return Value(arn->resource_id);
        } else if (const auto* url = std::get_if<Url>(&target)) {
            if (key == "scheme") return Value(url->scheme);
            if (key == "authority") return Value(url->authority);
            if (key == "path") return Value(url->path);
            if (key == "normalizedPath") return Value(url->normalized_path);
            if (key == "isIp") return Value(url->is_ip);
        } else if (const auto* partition = std::get_if<Partition>(&target)) {
            if (key == "name") return Value(partition->name);
            if (key == "dnsSuffix") return Value(partition->dns_suffix);
            if (key == "dualStackDnsSuffix") return Value(partition->dual_stack_dns_suffix);
            if (key == "supportsFIPS") return Value(partition->supports_fips);
            if (key == "supportsDualStack") return Value(partition->supports_dual_stack);
            if (key == "implicitGlobalRegion") return Value(partition->implicit_global_region);
        }
        return std::nullopt;
    }

} // end anonymous namespace

ValueType typeOf(const Value& value) {
    switch (value.index()) {
        case 0: return ValueType::Boolean;
        case 1: return ValueType::String;
        case 2: return ValueType::StringArray;
        case 3: return ValueType::Partition;
        case 4: return ValueType::Arn;
        case 5: return ValueType::Url;
        default: return ValueType::Integer;
    }
}

bool matchesType(const Value& value, ValueType type) {
    return type == ValueType::Any || typeOf(value) == type;
}

std::string typeName(ValueType type) {
    switch (type) {
        case ValueType::Boolean:     return "boolean";
        case ValueType::String:      return "string";
        case ValueType::StringArray: return "stringArray";
        case ValueType::Partition:   return "partition";
        case ValueType::Arn:         return "arn";
        case ValueType::Url:         return "url";
        case ValueType::Integer:     return "integer";
        case ValueType::Any:         return "any";
        default:                     return "unknown";
    }
}

ValueType typeFromString(const std::string& type_str) {
    std::string lower_str = utils::toLower(type_str);
    if (lower_str == "boolean" || lower_str == "bool") return ValueType::Boolean;
    if (lower_str == "string") return ValueType::String;
    if (lower_str == "stringarray") return ValueType::StringArray;
    if (lower_str == "partition") return ValueType::Partition;
    if (lower_str == "arn") return ValueType::Arn;
    if (lower_str == "url") return ValueType::Url;
    if (lower_str == "integer" || lower_str == "int") return ValueType::Integer;
    if (lower_str == "any") return ValueType::Any;
    throw std::invalid_argument("Unknown value type string: " + type_str);
}

std::string describe(const OptionalValue& value) {
    if (!value) {
        return "<absent>";
    }
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return fmt::format("\"{}\"", v);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, StringArray>) {
            return fmt::format("[{}]", fmt::join(v, ", "));
        } else if constexpr (std::is_same_v<T, Partition>) {
            return fmt::format("Partition({}, {})", v.name, v.dns_suffix);
        } else if constexpr (std::is_same_v<T, Arn>) {
            return fmt::format("Arn({}:{}:{}:{}:{})", v.partition, v.service, v.region,
                               v.account_id, fmt::join(v.resource_id, "/"));
        } else {
            return fmt::format("Url({}://{}{})", v.scheme, v.authority, v.path);
        }
    }, *value);
}

nlohmann::json toJson(const Value& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string> ||
                      std::is_same_v<T, StringArray> || std::is_same_v<T, std::int64_t>) {
            return nlohmann::json(v);
        } else if constexpr (std::is_same_v<T, Partition>) {
            return nlohmann::json{{"name", v.name},
                                  {"dnsSuffix", v.dns_suffix},
                                  {"dualStackDnsSuffix", v.dual_stack_dns_suffix},
                                  {"supportsFIPS", v.supports_fips},
                                  {"supportsDualStack", v.supports_dual_stack},
                                  {"implicitGlobalRegion", v.implicit_global_region}};
        } else if constexpr (std::is_same_v<T, Arn>) {
            return nlohmann::json{{"partition", v.partition},
                                  {"service", v.service},
                                  {"region", v.region},
                                  {"accountId", v.account_id},
                                  {"resourceId", v.resource_id}};
        } else {
            return nlohmann::json{{"scheme", v.scheme},
                                  {"authority", v.authority},
                                  {"path", v.path},
                                  {"normalizedPath", v.normalized_path},
                                  {"isIp", v.is_ip}};
        }
    }, value);
}

void validateAttrPath(const std::string& path) {
    parsePath(path);
}

OptionalValue getAttr(const Value& target, const std::string& path) {
    OptionalValue current = target;
    for (const auto& step : parsePath(path)) {
        if (step.is_index) {
            const auto* array = std::get_if<StringArray>(&*current);
            if (!array || step.index >= array->size()) {
                return std::nullopt;
            }
            current = Value((*array)[step.index]);
        } else {
            current = field(*current, step.key);
            if (!current) {
                return std::nullopt;
            }
        }
    }
    return current;
}

} // namespace core
