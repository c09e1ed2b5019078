#include "partition.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>

namespace endpoint_lib {

namespace {

    // Copies whichever output fields are present in 'outputs' onto 'partition'
    void applyOutputs(core::Partition& partition, const json& outputs) {
        if (!outputs.is_object()) {
            throw std::invalid_argument("partition outputs must be an object");
        }
        if (outputs.contains("name")) partition.name = outputs["name"].get<std::string>();
        if (outputs.contains("dnsSuffix")) partition.dns_suffix = outputs["dnsSuffix"].get<std::string>();
        if (outputs.contains("dualStackDnsSuffix")) partition.dual_stack_dns_suffix = outputs["dualStackDnsSuffix"].get<std::string>();
        if (outputs.contains("supportsFIPS")) partition.supports_fips = outputs["supportsFIPS"].get<bool>();
        if (outputs.contains("supportsDualStack")) partition.supports_dual_stack = outputs["supportsDualStack"].get<bool>();
        if (outputs.contains("implicitGlobalRegion")) partition.implicit_global_region = outputs["implicitGlobalRegion"].get<std::string>();
    }

    PartitionResolver::PartitionEntry parseEntry(const json& config) {
        if (!config.is_object() || !config.contains("id") || !config["id"].is_string()) {
            throw std::invalid_argument("Partition entry must be an object with an 'id' (string).");
        }
        PartitionResolver::PartitionEntry entry;
        entry.id = config["id"].get<std::string>();

        if (!config.contains("regionRegex") || !config["regionRegex"].is_string()) {
            throw std::invalid_argument(fmt::format("Partition '{}' requires 'regionRegex' (string).", entry.id));
        }
        entry.region_regex_source = config["regionRegex"].get<std::string>();
        try {
            entry.region_regex = std::regex(entry.region_regex_source, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument(fmt::format("Partition '{}' has an invalid regionRegex: {}", entry.id, e.what()));
        }

        if (!config.contains("outputs")) {
            throw std::invalid_argument(fmt::format("Partition '{}' requires 'outputs' (object).", entry.id));
        }
        applyOutputs(entry.outputs, config["outputs"]);
        if (entry.outputs.name.empty()) {
            entry.outputs.name = entry.id;
        }

        if (config.contains("regions")) {
            if (!config["regions"].is_object()) {
                throw std::invalid_argument(fmt::format("Partition '{}' has non-object 'regions'.", entry.id));
            }
            for (const auto& [region, overrides] : config["regions"].items()) {
                core::Partition probe = entry.outputs; // validate overrides up front
                applyOutputs(probe, overrides);
                entry.regions.emplace(region, overrides);
            }
        }
        return entry;
    }

} // end anonymous namespace

PartitionResolver::PartitionResolver(std::vector<PartitionEntry> partitions)
    : partitions_(std::move(partitions))
{
    if (partitions_.empty()) {
        throw core::PartitionDataException("Partition table must contain at least one partition.");
    }
    core::logging::getLogger()->debug("PartitionResolver created with {} partition(s).", partitions_.size());
}

std::shared_ptr<const PartitionResolver> PartitionResolver::fromJson(const json& document) {
    try {
        if (!document.is_object() || !document.contains("partitions") || !document["partitions"].is_array()) {
            throw std::invalid_argument("Partition document must be an object with a 'partitions' array.");
        }
        std::vector<PartitionEntry> entries;
        for (const auto& partition_conf : document["partitions"]) {
            entries.push_back(parseEntry(partition_conf));
        }
        return std::make_shared<const PartitionResolver>(std::move(entries));
    } catch (const json::exception& e) {
        core::logging::getLogger()->error("JSON error parsing partition data: {}", e.what());
        throw core::PartitionDataException(fmt::format("Invalid partition data: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        core::logging::getLogger()->error("Invalid partition data: {}", e.what());
        throw core::PartitionDataException(e.what());
    }
}

std::shared_ptr<const PartitionResolver> PartitionResolver::fromFile(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw core::PartitionDataException(fmt::format("Cannot open partition data file '{}'", path));
    }
    json document;
    try {
        input >> document;
    } catch (const json::exception& e) {
        throw core::PartitionDataException(fmt::format("Cannot parse partition data file '{}': {}", path, e.what()));
    }
    core::logging::getLogger()->info("Loading partition data from {}", path);
    return fromJson(document);
}

core::Partition PartitionResolver::withOverrides(const PartitionEntry& entry, const std::string& region) const {
    core::Partition partition = entry.outputs;
    auto it = entry.regions.find(region);
    if (it != entry.regions.end() && it->second.is_object()) {
        applyOutputs(partition, it->second);
    }
    return partition;
}

std::optional<core::Partition> PartitionResolver::resolvePartition(const std::string& region,
                                                                   core::DiagnosticCollector& diagnostics) const {
    auto logger = core::logging::getLogger();

    for (const auto& entry : partitions_) {
        if (entry.regions.count(region) > 0) {
            logger->trace("Region '{}' is listed explicitly in partition '{}'", region, entry.id);
            return withOverrides(entry, region);
        }
    }
    for (const auto& entry : partitions_) {
        if (std::regex_search(region, entry.region_regex)) {
            logger->trace("Region '{}' matched regionRegex of partition '{}'", region, entry.id);
            return entry.outputs;
        }
    }
    for (const auto& entry : partitions_) {
        if (entry.id == "aws") {
            logger->trace("Region '{}' matched no partition, defaulting to 'aws'", region);
            return entry.outputs;
        }
    }
    diagnostics.reportError(fmt::format("no partition found for region '{}'", region));
    return std::nullopt;
}

} // namespace endpoint_lib
