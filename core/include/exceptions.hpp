#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class EndpointRulesException : public std::runtime_error {
    public:
        explicit EndpointRulesException(const std::string& message)
            : std::runtime_error(message) {}

        explicit EndpointRulesException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types

    // The compiled rule tables are inconsistent (bad index, cycle, unbound variable...)
    class MalformedModelException : public EndpointRulesException {
    public: using EndpointRulesException::EndpointRulesException; };

    // A model names a function that was never registered
    class FunctionNotFoundException : public EndpointRulesException {
    public: using EndpointRulesException::EndpointRulesException; };

    // The serialized model document could not be read or parsed
    class ModelLoadException : public EndpointRulesException {
    public: using EndpointRulesException::EndpointRulesException; };

    class PartitionDataException : public EndpointRulesException {
    public: using EndpointRulesException::EndpointRulesException; };

    class RegistryFrozenException : public EndpointRulesException {
    public: using EndpointRulesException::EndpointRulesException; };

    class DuplicateFunctionException : public EndpointRulesException {
    public: using EndpointRulesException::EndpointRulesException; };

} // namespace core
