#include "lookup/enrichment_merger.hpp"
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
vector<InstanceRecord> EnrichmentMerger::merge(vector<InstanceRecord> instances, const map<string, VolumeRecord>& volumes)
// Merge the volume details
{
    for (auto& instance : instances) {
        instance.volumeDetails.clear();
        for (auto& mapping : instance.blockDeviceMappings) {
            if (!mapping.ebs)
                continue;
            auto it = volumes.find(mapping.ebs->volumeId);
            if (it != volumes.end())
                instance.volumeDetails[it->first] = it->second;
        }
    }
    return instances;
}
//---------------------------------------------------------------------------
AttachmentStatus EnrichmentMerger::attachmentStatus(const InstanceRecord& instance, const StorageAttachment& attachment)
// The attachment state
{
    if (!attachment.ebs)
        return AttachmentStatus::Ephemeral;
    if (instance.volumeDetails.contains(attachment.ebs->volumeId))
        return AttachmentStatus::Resolved;
    return AttachmentStatus::Unresolved;
}
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
