#include "lookup/instance_resolver.hpp"
#include "lookup/lookup_error.hpp"
#include <stdexcept>
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
string InstanceResolver::effectiveRegion(const optional<string>& region)
// The region or the default
{
    if (region && !region->empty())
        return *region;
    return defaultRegion;
}
//---------------------------------------------------------------------------
vector<cloud::Filter> InstanceResolver::filters(const string& name)
// The lookup filters
{
    return {
        {"tag:Name", {name}},
        {"instance-state-name", {"running", "stopped", "stopping", "pending", "shutting-down"}}};
}
//---------------------------------------------------------------------------
vector<InstanceRecord> InstanceResolver::resolve(const string& name, const optional<string>& region)
// Resolve and flatten the reservations
{
    vector<cloud::Reservation> reservations;
    try {
        reservations = _api.describeInstances(effectiveRegion(region), filters(name));
    } catch (const exception& e) {
        throw LookupError(e.what());
    }

    vector<InstanceRecord> instances;
    for (auto& reservation : reservations)
        for (auto& instance : reservation.instances)
            instances.push_back(move(instance));
    return instances;
}
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
