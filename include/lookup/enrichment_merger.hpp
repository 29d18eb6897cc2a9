#pragma once
#include "lookup/records.hpp"
#include <map>
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
/// Joins the EBS attachments of the instances with the fetched volumes
class EnrichmentMerger {
    public:
    /// One output record per input record in input order, only resolved volumes get details
    [[nodiscard]] static std::vector<InstanceRecord> merge(std::vector<InstanceRecord> instances, const std::map<std::string, VolumeRecord>& volumes);
    /// The state of an attachment of a merged instance
    [[nodiscard]] static AttachmentStatus attachmentStatus(const InstanceRecord& instance, const StorageAttachment& attachment);
};
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
