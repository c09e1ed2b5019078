#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace core {

    // One fresh (non-memoized) condition evaluation
    struct ConditionRecord {
        std::size_t condition_index = 0;
        std::string function_id;
        OptionalValue value;   // What the condition's function produced
        bool outcome = false;  // Branch taken: true -> high, false -> low
    };

    // --- DiagnosticCollector ---
    // Call-scoped trace of condition evaluations and errors reported by rule
    // functions. Never shared between resolve calls.
    class DiagnosticCollector {
    public:
        DiagnosticCollector() = default;

        void record(std::size_t condition_index, const std::string& function_id,
                    const OptionalValue& value, bool outcome);

        // Functions report why they produced no value (e.g. "invalid ARN")
        void reportError(std::string message);

        const std::vector<ConditionRecord>& records() const { return records_; }
        const std::vector<std::string>& errors() const { return errors_; }
        bool empty() const { return records_.empty() && errors_.empty(); }

        // Multi-line rendering of the trace, for logs and failure messages
        std::string summary() const;

    private:
        std::vector<ConditionRecord> records_;
        std::vector<std::string> errors_;
    };

} // namespace core
