#pragma once
#include "cloud/ec2_api.hpp"
#include "lookup/records.hpp"
#include <optional>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// EC2Scout Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2scout {
namespace lookup {
//---------------------------------------------------------------------------
/// Finds the non-terminated instances with a Name tag
class InstanceResolver {
    /// The api
    cloud::EC2Api& _api;

    public:
    /// The region used if none is given
    static constexpr const char* defaultRegion = "ap-southeast-2";

    /// The constructor
    explicit InstanceResolver(cloud::EC2Api& api) : _api(api) {}

    /// Resolve the name, empty if nothing matches, throws LookupError
    [[nodiscard]] std::vector<InstanceRecord> resolve(const std::string& name, const std::optional<std::string>& region = std::nullopt);
    /// Get the effective region
    [[nodiscard]] static std::string effectiveRegion(const std::optional<std::string>& region);
    /// The filters for the name, tag:Name and all non-terminated states
    [[nodiscard]] static std::vector<cloud::Filter> filters(const std::string& name);
};
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
