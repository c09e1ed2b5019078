#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace core {

    using StringArray = std::vector<std::string>;

    // Partition descriptor produced by aws.partition
    struct Partition {
        std::string name;
        std::string dns_suffix;
        std::string dual_stack_dns_suffix;
        bool supports_fips = false;
        bool supports_dual_stack = false;
        std::string implicit_global_region;

        bool operator==(const Partition& other) const {
            return name == other.name && dns_suffix == other.dns_suffix &&
                   dual_stack_dns_suffix == other.dual_stack_dns_suffix &&
                   supports_fips == other.supports_fips &&
                   supports_dual_stack == other.supports_dual_stack &&
                   implicit_global_region == other.implicit_global_region;
        }
        bool operator!=(const Partition& other) const { return !(*this == other); }
    };

    // arn:<partition>:<service>:<region>:<account_id>:<resource>
    struct Arn {
        std::string partition;
        std::string service;
        std::string region;
        std::string account_id;
        StringArray resource_id; // resource split on ':' and '/'

        bool operator==(const Arn& other) const {
            return partition == other.partition && service == other.service &&
                   region == other.region && account_id == other.account_id &&
                   resource_id == other.resource_id;
        }
        bool operator!=(const Arn& other) const { return !(*this == other); }
    };

    struct Url {
        std::string scheme;
        std::string authority;
        std::string path;
        std::string normalized_path; // always ends with '/'
        bool is_ip = false;

        bool operator==(const Url& other) const {
            return scheme == other.scheme && authority == other.authority &&
                   path == other.path && normalized_path == other.normalized_path &&
                   is_ip == other.is_ip;
        }
        bool operator!=(const Url& other) const { return !(*this == other); }
    };

    // Declared type of a parameter, binding or function result
    enum class ValueType {
        Boolean,
        String,
        StringArray,
        Partition,
        Arn,
        Url,
        Integer,    // literal function arguments only (substring offsets, split limits)
        Any
    };

    // A value produced while evaluating rules. Absence is modelled with OptionalValue.
    using Value = std::variant<bool, std::string, StringArray, Partition, Arn, Url, std::int64_t>;
    using OptionalValue = std::optional<Value>;

    ValueType typeOf(const Value& value);
    bool matchesType(const Value& value, ValueType type);
    std::string typeName(ValueType type);
    // Parses "string", "boolean", "stringArray", ... (case-insensitive); throws std::invalid_argument
    ValueType typeFromString(const std::string& type_str);

    // Short human readable rendering used in logs and diagnostics
    std::string describe(const OptionalValue& value);

    nlohmann::json toJson(const Value& value);

    // Navigates a structured value: "resourceId[1]", "dnsSuffix", "[0]"
    // Returns nullopt for unknown fields or out-of-range indices; throws
    // std::invalid_argument for a syntactically invalid path.
    OptionalValue getAttr(const Value& target, const std::string& path);
    // Same path syntax check getAttr performs; throws std::invalid_argument
    void validateAttrPath(const std::string& path);

    // The resolved network target
    struct Endpoint {
        std::string url;
        std::map<std::string, std::vector<std::string>> headers;
        std::map<std::string, nlohmann::json> properties;

        bool operator==(const Endpoint& other) const {
            return url == other.url && headers == other.headers && properties == other.properties;
        }
        bool operator!=(const Endpoint& other) const { return !(*this == other); }
    };

} // namespace core
