#pragma once
#include "cloud/ec2_model.hpp"
#include <cstdint>
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
using InstanceRecord = cloud::Instance;
using VolumeRecord = cloud::Volume;
using StorageAttachment = cloud::BlockDeviceMapping;
//---------------------------------------------------------------------------
/// The enrichment state of a storage attachment
enum class AttachmentStatus : uint8_t {
    /// EBS volume with details
    Resolved,
    /// Instance store, never looked up
    Ephemeral,
    /// EBS volume whose details could not be retrieved
    Unresolved
};
//---------------------------------------------------------------------------
/// The assembled result of one lookup
struct ReportResult {
    /// The searched name
    std::string searchQuery;
    /// The effective region
    std::string region;
    /// The launch time of the first instance, normalized
    std::optional<std::string> timestamp;
    /// The enriched instances in resolver order, timestamps normalized
    std::vector<InstanceRecord> instances;

    /// The number of instances
    [[nodiscard]] uint64_t instanceCount() const { return instances.size(); }
};
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
