#pragma once
#include "cloud/ec2_api.hpp"
#include "lookup/instance_resolver.hpp"
#include "lookup/records.hpp"
#include "lookup/volume_fetcher.hpp"
#include <optional>
#include <string>
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
/// Runs resolve, volume fetch, merge and assembly for one name
class LookupPipeline {
    /// The resolver
    InstanceResolver _resolver;
    /// The fetcher
    VolumeFetcher _fetcher;

    public:
    /// The constructor
    explicit LookupPipeline(cloud::EC2Api& api) : _resolver(api), _fetcher(api) {}

    /// Run the lookup, nullopt if no instance matches, throws LookupError
    [[nodiscard]] std::optional<ReportResult> run(const std::string& name, const std::optional<std::string>& region = std::nullopt);
};
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
