#include "lookup/pipeline.hpp"
#include "lookup/enrichment_merger.hpp"
#include "lookup/report_assembler.hpp"
#include <iostream>
#include <utility>
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
using namespace std;
//---------------------------------------------------------------------------
optional<ReportResult> LookupPipeline::run(const string& name, const optional<string>& region)
// Run the lookup
{
    auto effectiveRegion = InstanceResolver::effectiveRegion(region);
    auto instances = _resolver.resolve(name, effectiveRegion);
    if (instances.empty())
        return nullopt;

    if (instances.size() > 1) {
        cerr << "Found " << instances.size() << " instances with name: " << name << endl;
        cerr << "Showing details for all instances:" << endl;
    }

    auto volumes = _fetcher.fetchVolumes(VolumeFetcher::collectVolumeIds(instances), effectiveRegion);
    auto merged = EnrichmentMerger::merge(move(instances), volumes);
    return ReportAssembler::toResult(name, effectiveRegion, move(merged));
}
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
