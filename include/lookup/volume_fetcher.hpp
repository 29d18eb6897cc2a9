#pragma once
#include "cloud/ec2_api.hpp"
#include "lookup/records.hpp"
#include <map>
#include <set>
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
/// Retrieves the volume metadata in one batched query.
/// A failed query is reported as a warning and yields no details.
class VolumeFetcher {
    /// The api
    cloud::EC2Api& _api;

    public:
    /// The constructor
    explicit VolumeFetcher(cloud::EC2Api& api) : _api(api) {}

    /// Fetch the volumes by id, never throws for remote failures
    [[nodiscard]] std::map<std::string, VolumeRecord> fetchVolumes(const std::set<std::string>& volumeIds, const std::string& region);
    /// Collect the distinct EBS volume ids of all instances
    [[nodiscard]] static std::set<std::string> collectVolumeIds(const std::vector<InstanceRecord>& instances);
};
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
