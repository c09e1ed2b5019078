#include "standard_library.hpp"
#include "arn.hpp"
#include "host.hpp"
#include "parse_url.hpp"
#include "string_functions.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace rules_engine {

    using core::OptionalValue;
    using core::Value;
    using Args = std::vector<OptionalValue>;

    namespace { // Argument helpers shared by every built-in

        void requireArity(const std::string& id, const Args& args, std::size_t min_args, std::size_t max_args) {
            if (args.size() < min_args || args.size() > max_args) {
                throw core::MalformedModelException(
                    min_args == max_args
                        ? fmt::format("Function '{}' expects {} argument(s), got {}.", id, min_args, args.size())
                        : fmt::format("Function '{}' expects {} to {} arguments, got {}.", id, min_args, max_args, args.size()));
            }
        }

        // nullopt when the argument is missing or absent; a present value of the
        // wrong type is a model error
        template <typename T>
        std::optional<T> argAs(const std::string& id, const Args& args, std::size_t i, const char* expected) {
            if (i >= args.size() || !args[i]) {
                return std::nullopt;
            }
            if (const T* value = std::get_if<T>(&*args[i])) {
                return *value;
            }
            throw core::MalformedModelException(fmt::format("Argument {} of '{}' must be {}, got {}.",
                                                            i, id, expected, core::describe(args[i])));
        }

        std::optional<std::string> stringArg(const std::string& id, const Args& args, std::size_t i) {
            return argAs<std::string>(id, args, i, "a string");
        }

        std::optional<bool> boolArg(const std::string& id, const Args& args, std::size_t i) {
            return argAs<bool>(id, args, i, "a boolean");
        }

        std::optional<std::int64_t> intArg(const std::string& id, const Args& args, std::size_t i) {
            return argAs<std::int64_t>(id, args, i, "an integer");
        }

        // --- Standard functions ---

        OptionalValue isSetFn(const Args& args, core::DiagnosticCollector&) {
            requireArity("isSet", args, 1, 1);
            return Value(args[0].has_value());
        }

        OptionalValue notFn(const Args& args, core::DiagnosticCollector&) {
            requireArity("not", args, 1, 1);
            auto operand = boolArg("not", args, 0);
            if (!operand) return std::nullopt;
            return Value(!*operand);
        }

        OptionalValue booleanEqualsFn(const Args& args, core::DiagnosticCollector&) {
            requireArity("booleanEquals", args, 2, 2);
            auto lhs = boolArg("booleanEquals", args, 0);
            auto rhs = boolArg("booleanEquals", args, 1);
            return Value(lhs.has_value() && rhs.has_value() && *lhs == *rhs);
        }

        OptionalValue stringEqualsFn(const Args& args, core::DiagnosticCollector&) {
            requireArity("stringEquals", args, 2, 2);
            auto lhs = stringArg("stringEquals", args, 0);
            auto rhs = stringArg("stringEquals", args, 1);
            return Value(lhs.has_value() && rhs.has_value() && *lhs == *rhs);
        }

        OptionalValue getAttrFn(const Args& args, core::DiagnosticCollector&) {
            requireArity("getAttr", args, 2, 2);
            auto path = stringArg("getAttr", args, 1);
            if (!path) {
                throw core::MalformedModelException("getAttr requires a literal path.");
            }
            if (!args[0]) return std::nullopt;
            try {
                return core::getAttr(*args[0], *path);
            } catch (const std::invalid_argument& e) {
                throw core::MalformedModelException(e.what());
            }
        }

        OptionalValue substringFn(const Args& args, core::DiagnosticCollector&) {
            requireArity("substring", args, 4, 4);
            auto input = stringArg("substring", args, 0);
            auto start = intArg("substring", args, 1);
            auto stop = intArg("substring", args, 2);
            auto reverse = boolArg("substring", args, 3);
            if (!input || !start || !stop || !reverse || *start < 0 || *stop < 0) {
                return std::nullopt;
            }
            auto result = endpoint_lib::substring(*input, static_cast<std::size_t>(*start),
                                                  static_cast<std::size_t>(*stop), *reverse);
            if (!result) return std::nullopt;
            return Value(*result);
        }

        OptionalValue isValidHostLabelFn(const Args& args, core::DiagnosticCollector&) {
            requireArity("isValidHostLabel", args, 2, 2);
            auto label = stringArg("isValidHostLabel", args, 0);
            auto allow_subdomains = boolArg("isValidHostLabel", args, 1);
            if (!label || !allow_subdomains) return std::nullopt;
            return Value(endpoint_lib::isValidHostLabel(*label, *allow_subdomains));
        }

        OptionalValue uriEncodeFn(const Args& args, core::DiagnosticCollector&) {
            requireArity("uriEncode", args, 1, 1);
            auto input = stringArg("uriEncode", args, 0);
            if (!input) return std::nullopt;
            return Value(endpoint_lib::uriEncode(*input));
        }

        OptionalValue parseUrlFn(const Args& args, core::DiagnosticCollector& diagnostics) {
            requireArity("parseURL", args, 1, 1);
            auto input = stringArg("parseURL", args, 0);
            if (!input) return std::nullopt;
            auto url = endpoint_lib::parseUrl(*input, diagnostics);
            if (!url) return std::nullopt;
            return Value(*url);
        }

        OptionalValue coalesceFn(const Args& args, core::DiagnosticCollector&) {
            if (args.empty()) {
                throw core::MalformedModelException("Function 'coalesce' expects at least one argument.");
            }
            return coalesceValues(args);
        }

        OptionalValue splitFn(const Args& args, core::DiagnosticCollector&) {
            requireArity("split", args, 2, 3);
            auto input = stringArg("split", args, 0);
            auto delimiter = stringArg("split", args, 1);
            auto limit = intArg("split", args, 2);
            if (!input || !delimiter) return std::nullopt;
            if (delimiter->empty()) {
                throw core::MalformedModelException("split requires a non-empty delimiter.");
            }
            std::size_t parts = (limit && *limit > 0) ? static_cast<std::size_t>(*limit) : 0;
            return Value(endpoint_lib::split(*input, *delimiter, parts));
        }

        // --- AWS functions ---

        OptionalValue parseArnFn(const Args& args, core::DiagnosticCollector& diagnostics) {
            requireArity("aws.parseArn", args, 1, 1);
            auto input = stringArg("aws.parseArn", args, 0);
            if (!input) return std::nullopt;
            auto arn = endpoint_lib::parseArn(*input, diagnostics);
            if (!arn) return std::nullopt;
            return Value(*arn);
        }

        OptionalValue isVirtualHostableS3BucketFn(const Args& args, core::DiagnosticCollector&) {
            requireArity("aws.isVirtualHostableS3Bucket", args, 2, 2);
            auto bucket = stringArg("aws.isVirtualHostableS3Bucket", args, 0);
            auto allow_subdomains = boolArg("aws.isVirtualHostableS3Bucket", args, 1);
            if (!bucket || !allow_subdomains) return std::nullopt;
            return Value(endpoint_lib::isVirtualHostableS3Bucket(*bucket, *allow_subdomains));
        }

    } // end anonymous namespace

core::OptionalValue coalesceValues(const std::vector<core::OptionalValue>& operands) {
    for (const auto& operand : operands) {
        if (operand) {
            return operand;
        }
    }
    return operands.empty() ? std::nullopt : operands.back();
}

void registerStandardFunctions(FunctionRegistry& registry) {
    using core::ValueType;
    registry.registerFunction("isSet", isSetFn, false, ValueType::Boolean, {1, 1});
    registry.registerFunction("not", notFn, false, ValueType::Boolean, {1, 1});
    registry.registerFunction("booleanEquals", booleanEqualsFn, false, ValueType::Boolean, {2, 2});
    registry.registerFunction("stringEquals", stringEqualsFn, false, ValueType::Boolean, {2, 2});
    registry.registerFunction("getAttr", getAttrFn, false, ValueType::Any, {2, 2});
    registry.registerFunction("substring", substringFn, false, ValueType::String, {4, 4});
    registry.registerFunction("isValidHostLabel", isValidHostLabelFn, false, ValueType::Boolean, {2, 2});
    registry.registerFunction("uriEncode", uriEncodeFn, false, ValueType::String, {1, 1});
    registry.registerFunction("parseURL", parseUrlFn, false, ValueType::Url, {1, 1});
    registry.registerFunction("coalesce", coalesceFn, false, ValueType::Any, {1});
    registry.registerFunction("split", splitFn, false, ValueType::StringArray, {2, 3});
    core::logging::getLogger()->debug("Registered standard rule functions.");
}

void registerAwsFunctions(FunctionRegistry& registry,
                          std::shared_ptr<const endpoint_lib::PartitionResolver> partitions) {
    if (!partitions) {
        throw std::invalid_argument("registerAwsFunctions requires a partition resolver.");
    }
    registry.registerFunction(
        "aws.partition",
        [partitions](const Args& args, core::DiagnosticCollector& diagnostics) -> OptionalValue {
            requireArity("aws.partition", args, 1, 1);
            auto region = stringArg("aws.partition", args, 0);
            if (!region) return std::nullopt;
            auto partition = partitions->resolvePartition(*region, diagnostics);
            if (!partition) return std::nullopt;
            return Value(*partition);
        },
        true, core::ValueType::Partition, {1, 1});
    registry.registerFunction("aws.parseArn", parseArnFn, false, core::ValueType::Arn, {1, 1});
    registry.registerFunction("aws.isVirtualHostableS3Bucket", isVirtualHostableS3BucketFn, false,
                              core::ValueType::Boolean, {2, 2});
    core::logging::getLogger()->debug("Registered AWS rule functions ({} partition(s)).", partitions->partitionCount());
}

} // namespace rules_engine
