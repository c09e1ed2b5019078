#pragma once

#include "datatypes.hpp"
#include <map>
#include <string>

namespace rules_engine {

    // --- EvaluationContext ---
    // Per-call variable bindings produced by conditions. A binding may hold an
    // absent value: "evaluated and absent" differs from "never evaluated".
    class EvaluationContext {
    public:
        EvaluationContext() = default;

        // Throws core::MalformedModelException if 'name' is already bound
        void bind(const std::string& name, core::OptionalValue value);

        bool isBound(const std::string& name) const;
        // Absent for unbound names as well as for bindings that hold no value
        core::OptionalValue lookup(const std::string& name) const;

        std::size_t size() const { return variables_.size(); }
        const std::map<std::string, core::OptionalValue>& variables() const { return variables_; }

    private:
        std::map<std::string, core::OptionalValue> variables_;
    };

} // namespace rules_engine
