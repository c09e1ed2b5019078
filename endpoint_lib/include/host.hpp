#pragma once

#include <string>

namespace endpoint_lib {

    // A host label is 1-63 characters of [A-Za-z0-9-] that does not start with '-'.
    // With allow_subdomains every '.'-separated label must be valid.
    bool isValidHostLabel(const std::string& label, bool allow_subdomains);

    // S3 bucket names usable as a virtual-hosted label: lower case, 3-63 characters,
    // no IPv4 look-alikes and no ".-" / "-." sequences.
    bool isVirtualHostableS3Bucket(const std::string& bucket, bool allow_subdomains);

} // namespace endpoint_lib
