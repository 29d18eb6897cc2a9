#include "lookup/volume_fetcher.hpp"
#include <exception>
#include <iostream>
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
set<string> VolumeFetcher::collectVolumeIds(const vector<InstanceRecord>& instances)
// Collect the ids
{
    set<string> volumeIds;
    for (auto& instance : instances)
        for (auto& mapping : instance.blockDeviceMappings)
            if (mapping.ebs && !mapping.ebs->volumeId.empty())
                volumeIds.insert(mapping.ebs->volumeId);
    return volumeIds;
}
//---------------------------------------------------------------------------
map<string, VolumeRecord> VolumeFetcher::fetchVolumes(const set<string>& volumeIds, const string& region)
// Fetch the volumes
{
    map<string, VolumeRecord> volumes;
    if (volumeIds.empty())
        return volumes;

    try {
        for (auto& volume : _api.describeVolumes(region, vector<string>(volumeIds.begin(), volumeIds.end())))
            volumes.emplace(volume.volumeId, move(volume));
    } catch (const exception& e) {
        cerr << "Warning: Could not retrieve volume details: " << e.what() << endl;
        volumes.clear();
    }
    return volumes;
}
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
