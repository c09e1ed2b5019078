#pragma once

#include "function_registry.hpp"
#include "partition.hpp"
#include <memory>
#include <vector>

namespace rules_engine {

    // isSet, not, booleanEquals, stringEquals, getAttr, substring, isValidHostLabel,
    // uriEncode, parseURL, coalesce, split
    void registerStandardFunctions(FunctionRegistry& registry);

    // aws.partition (needs the partition table), aws.parseArn, aws.isVirtualHostableS3Bucket
    void registerAwsFunctions(FunctionRegistry& registry,
                              std::shared_ptr<const endpoint_lib::PartitionResolver> partitions);

    // First present operand, otherwise the last operand (which may itself be absent)
    core::OptionalValue coalesceValues(const std::vector<core::OptionalValue>& operands);

} // namespace rules_engine
