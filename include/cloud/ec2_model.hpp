#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// EC2Scout Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2scout {
namespace cloud {
//---------------------------------------------------------------------------
/// The EBS volume as returned by DescribeVolumes
struct Volume {
    /// The volume id
    std::string volumeId;
    /// The size in GiB
    int64_t size = 0;
    /// The volume type, e.g. gp3
    std::string volumeType;
    /// The lifecycle state, e.g. in-use
    std::string state;
    /// Is the volume encrypted
    bool encrypted = false;
    /// The provisioned iops
    std::optional<int64_t> iops;
    /// The provisioned throughput in MiB/s
    std::optional<int64_t> throughput;
    /// The source snapshot
    std::optional<std::string> snapshotId;
    /// The availability zone
    std::string availabilityZone;
    /// The creation time
    std::string createTime;
    /// Is multi attach enabled
    bool multiAttachEnabled = false;

    bool operator==(const Volume&) const = default;
};
//---------------------------------------------------------------------------
/// The EBS part of a block device mapping
struct EbsAttachment {
    std::string volumeId;
    std::string status;
    std::string attachTime;
    bool deleteOnTermination = false;
};
//---------------------------------------------------------------------------
/// A block device mapping, instance store devices have no EBS part
struct BlockDeviceMapping {
    /// The device name, e.g. /dev/xvda
    std::string deviceName;
    /// The EBS attachment
    std::optional<EbsAttachment> ebs;
};
//---------------------------------------------------------------------------
struct InstanceState {
    /// The numeric state code
    int32_t code = 0;
    /// The state name, e.g. running
    std::string name;
};
//---------------------------------------------------------------------------
struct SecurityGroup {
    std::string groupId;
    std::string groupName;
};
//---------------------------------------------------------------------------
struct Tag {
    std::string key;
    std::string value;
};
//---------------------------------------------------------------------------
struct Placement {
    std::string availabilityZone;
    std::string tenancy;
};
//---------------------------------------------------------------------------
/// The EC2 instance as returned by DescribeInstances
struct Instance {
    std::string instanceId;
    std::string imageId;
    std::string instanceType;
    InstanceState state;
    std::string launchTime;
    std::string architecture;
    /// Only set for windows, Linux/UNIX otherwise
    std::optional<std::string> platform;
    std::string platformDetails;
    std::string vpcId;
    std::string subnetId;
    std::string privateIpAddress;
    std::optional<std::string> publicIpAddress;
    std::string privateDnsName;
    std::optional<std::string> publicDnsName;
    std::vector<SecurityGroup> securityGroups;
    /// The tags in the order returned
    std::vector<Tag> tags;
    Placement placement;
    std::string rootDeviceName;
    std::string rootDeviceType;
    std::string virtualizationType;
    std::string hypervisor;
    bool ebsOptimized = false;
    std::string monitoringState;
    std::vector<BlockDeviceMapping> blockDeviceMappings;
    std::optional<std::string> keyName;
    /// The remaining fields of the response in PascalCase, e.g. NetworkInterfaces or IamInstanceProfile
    nlohmann::ordered_json additionalFields = nlohmann::ordered_json::object();
    /// The details of the successfully resolved EBS volumes by volume id
    std::map<std::string, Volume> volumeDetails;
};
//---------------------------------------------------------------------------
/// The grouping container of DescribeInstances
struct Reservation {
    std::string reservationId;
    std::string ownerId;
    std::vector<Instance> instances;
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace ec2scout
