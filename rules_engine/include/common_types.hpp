#pragma once
#include "datatypes.hpp"
#include <cstdint>
#include <cstddef>
#include <map>
#include <string>

namespace rules_engine {

    // --- Decision diagram reference encoding ---
    //   ref >= 0   -> index into the node array
    //   ref == -1  -> "no rule matched" terminal
    //   ref <= -2  -> result index -(ref + 2)
    using NodeRef = std::int64_t;

    constexpr NodeRef kNoMatchRef = -1;

    inline bool isNodeRef(NodeRef ref) { return ref >= 0; }
    inline bool isNoMatchRef(NodeRef ref) { return ref == kNoMatchRef; }
    inline bool isResultRef(NodeRef ref) { return ref <= -2; }
    inline std::size_t resultIndexOf(NodeRef ref) { return static_cast<std::size_t>(-(ref + 2)); }
    inline NodeRef resultRef(std::size_t result_index) { return -static_cast<NodeRef>(result_index) - 2; }

    // Caller-supplied parameter values, keyed by declared parameter name
    using ParameterMap = std::map<std::string, core::Value>;

    enum class FailureKind {
        NoRuleMatched,     // No path reached an endpoint
        RuleDefinedError,  // An Error result was reached; message is caller-facing
        InvalidParameters, // Missing required / wrongly typed / undeclared parameter
        RenderError        // Endpoint URL expression did not produce a string
    };

    inline const char* failureKindName(FailureKind kind) {
        switch (kind) {
            case FailureKind::NoRuleMatched:     return "NoRuleMatched";
            case FailureKind::RuleDefinedError:  return "RuleDefinedError";
            case FailureKind::InvalidParameters: return "InvalidParameters";
            case FailureKind::RenderError:       return "RenderError";
            default:                             return "UnknownFailure";
        }
    }

} // namespace rules_engine
