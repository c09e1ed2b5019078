#pragma once

#include "datatypes.hpp"
#include "diagnostics.hpp"
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace endpoint_lib {

    using json = nlohmann::json;

    // --- PartitionResolver ---
    // Maps a region name to its partition descriptor using the standard
    // partitions.json table. Immutable once built; safe to share across threads.
    class PartitionResolver {
    public:
        struct PartitionEntry {
            std::string id;
            std::string region_regex_source;
            std::regex region_regex;
            std::map<std::string, json> regions; // explicit region -> output overrides
            core::Partition outputs;
        };

        explicit PartitionResolver(std::vector<PartitionEntry> partitions);

        // Throws core::PartitionDataException on invalid documents
        static std::shared_ptr<const PartitionResolver> fromJson(const json& document);
        static std::shared_ptr<const PartitionResolver> fromFile(const std::string& path);

        // Explicit region entry first, then the first matching regionRegex,
        // then the "aws" partition as the default.
        std::optional<core::Partition> resolvePartition(const std::string& region,
                                                        core::DiagnosticCollector& diagnostics) const;

        std::size_t partitionCount() const { return partitions_.size(); }

    private:
        std::vector<PartitionEntry> partitions_;

        core::Partition withOverrides(const PartitionEntry& entry, const std::string& region) const;
    };

} // namespace endpoint_lib
