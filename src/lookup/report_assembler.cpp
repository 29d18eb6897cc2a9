#include "lookup/report_assembler.hpp"
#include "lookup/enrichment_merger.hpp"
#include "utils/utils.hpp"
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
using nlohmann::ordered_json;
//---------------------------------------------------------------------------
ReportResult ReportAssembler::toResult(const string& name, const string& region, vector<InstanceRecord> instances)
// Build the result
{
    for (auto& instance : instances) {
        instance.launchTime = utils::normalizeTimestamp(instance.launchTime);
        for (auto& mapping : instance.blockDeviceMappings)
            if (mapping.ebs)
                mapping.ebs->attachTime = utils::normalizeTimestamp(mapping.ebs->attachTime);
        for (auto& [id, volume] : instance.volumeDetails)
            volume.createTime = utils::normalizeTimestamp(volume.createTime);
    }

    ReportResult result;
    result.searchQuery = name;
    result.region = region;
    if (!instances.empty())
        result.timestamp = instances.front().launchTime;
    result.instances = move(instances);
    return result;
}
//---------------------------------------------------------------------------
ordered_json ReportAssembler::volumeToJson(const VolumeRecord& volume)
// The volume details
{
    ordered_json json;
    json["Size"] = volume.size;
    json["VolumeType"] = volume.volumeType;
    json["State"] = volume.state;
    json["Encrypted"] = volume.encrypted;
    json["Iops"] = volume.iops ? ordered_json(*volume.iops) : ordered_json(notApplicable);
    json["Throughput"] = volume.throughput ? ordered_json(*volume.throughput) : ordered_json(notApplicable);
    json["SnapshotId"] = volume.snapshotId ? *volume.snapshotId : notApplicable;
    json["AvailabilityZone"] = volume.availabilityZone;
    json["CreateTime"] = volume.createTime;
    json["MultiAttachEnabled"] = volume.multiAttachEnabled;
    return json;
}
//---------------------------------------------------------------------------
ordered_json ReportAssembler::instanceToJson(const InstanceRecord& instance)
// The instance in the layout of the EC2 API
{
    ordered_json json;
    json["InstanceId"] = instance.instanceId;
    json["ImageId"] = instance.imageId;
    json["InstanceType"] = instance.instanceType;
    json["State"] = {{"Code", instance.state.code}, {"Name", instance.state.name}};
    json["LaunchTime"] = instance.launchTime;
    json["Architecture"] = instance.architecture;
    if (instance.platform)
        json["Platform"] = *instance.platform;
    json["PlatformDetails"] = instance.platformDetails;
    if (instance.keyName)
        json["KeyName"] = *instance.keyName;
    json["Placement"] = {{"AvailabilityZone", instance.placement.availabilityZone}, {"Tenancy", instance.placement.tenancy}};
    json["Monitoring"] = {{"State", instance.monitoringState}};
    json["VpcId"] = instance.vpcId;
    json["SubnetId"] = instance.subnetId;
    json["PrivateIpAddress"] = instance.privateIpAddress;
    if (instance.publicIpAddress)
        json["PublicIpAddress"] = *instance.publicIpAddress;
    json["PrivateDnsName"] = instance.privateDnsName;
    json["PublicDnsName"] = instance.publicDnsName.value_or("");

    auto groups = ordered_json::array();
    for (auto& group : instance.securityGroups)
        groups.push_back({{"GroupName", group.groupName}, {"GroupId", group.groupId}});
    json["SecurityGroups"] = move(groups);

    if (!instance.tags.empty()) {
        auto tags = ordered_json::array();
        for (auto& tag : instance.tags)
            tags.push_back({{"Key", tag.key}, {"Value", tag.value}});
        json["Tags"] = move(tags);
    }

    json["RootDeviceName"] = instance.rootDeviceName;
    json["RootDeviceType"] = instance.rootDeviceType;
    auto mappings = ordered_json::array();
    for (auto& mapping : instance.blockDeviceMappings) {
        ordered_json device;
        device["DeviceName"] = mapping.deviceName;
        if (mapping.ebs) {
            device["Ebs"] = {
                {"AttachTime", mapping.ebs->attachTime},
                {"DeleteOnTermination", mapping.ebs->deleteOnTermination},
                {"Status", mapping.ebs->status},
                {"VolumeId", mapping.ebs->volumeId}};
        }
        mappings.push_back(move(device));
    }
    json["BlockDeviceMappings"] = move(mappings);
    json["VirtualizationType"] = instance.virtualizationType;
    json["Hypervisor"] = instance.hypervisor;
    json["EbsOptimized"] = instance.ebsOptimized;

    // The remaining response fields, partially modelled objects only gain their missing members
    for (auto& [key, value] : instance.additionalFields.items()) {
        if (!json.contains(key)) {
            json[key] = value;
        } else if (json[key].is_object() && value.is_object()) {
            for (auto& [member, memberValue] : value.items())
                if (!json[key].contains(member))
                    json[key][member] = memberValue;
        }
    }

    auto details = ordered_json::object();
    for (auto& [id, volume] : instance.volumeDetails)
        details[id] = volumeToJson(volume);
    json["VolumeDetails"] = move(details);
    return json;
}
//---------------------------------------------------------------------------
ordered_json ReportAssembler::toJson(const ReportResult& result)
// The document
{
    ordered_json json;
    json["search_query"] = result.searchQuery;
    json["region"] = result.region;
    json["timestamp"] = result.timestamp ? ordered_json(*result.timestamp) : ordered_json(nullptr);
    json["instance_count"] = result.instanceCount();
    auto instances = ordered_json::array();
    for (auto& instance : result.instances)
        instances.push_back(instanceToJson(instance));
    json["instances"] = move(instances);
    return json;
}
//---------------------------------------------------------------------------
string ReportAssembler::serialize(const ReportResult& result)
// Two space indentation
{
    return toJson(result).dump(2);
}
//---------------------------------------------------------------------------
void ReportAssembler::renderStorage(const InstanceRecord& instance, vector<string>& lines)
// The storage block
{
    lines.emplace_back("");
    lines.emplace_back("Storage:");
    for (auto& mapping : instance.blockDeviceMappings) {
        switch (EnrichmentMerger::attachmentStatus(instance, mapping)) {
            case AttachmentStatus::Ephemeral:
                lines.push_back("  " + mapping.deviceName + ": Instance store volume");
                break;
            case AttachmentStatus::Unresolved:
                lines.push_back("  " + mapping.deviceName + ": " + mapping.ebs->volumeId + " (details unavailable)");
                break;
            case AttachmentStatus::Resolved: {
                auto& volume = instance.volumeDetails.at(mapping.ebs->volumeId);
                lines.push_back("  " + mapping.deviceName + ": " + mapping.ebs->volumeId);
                lines.push_back("    Size: " + to_string(volume.size) + " GB");
                lines.push_back("    Type: " + volume.volumeType);
                lines.push_back("    State: " + volume.state);
                lines.push_back(string("    Encrypted: ") + (volume.encrypted ? "True" : "False"));
                if (volume.iops)
                    lines.push_back("    IOPS: " + to_string(*volume.iops));
                if (volume.throughput)
                    lines.push_back("    Throughput: " + to_string(*volume.throughput) + " MB/s");
                break;
            }
        }
    }
}
//---------------------------------------------------------------------------
vector<string> ReportAssembler::render(const vector<InstanceRecord>& instances)
// The textual report
{
    static const string separator(50, '=');
    vector<string> lines;
    for (size_t i = 0; i < instances.size(); i++) {
        auto& instance = instances[i];
        if (instances.size() > 1) {
            lines.emplace_back("");
            lines.push_back(separator);
            lines.push_back("INSTANCE " + to_string(i + 1) + " of " + to_string(instances.size()));
            lines.push_back(separator);
        }

        lines.push_back("Instance ID: " + instance.instanceId);
        lines.push_back("Instance Type: " + instance.instanceType);
        lines.push_back("State: " + instance.state.name);
        lines.push_back("Launch Time: " + instance.launchTime);
        lines.push_back("Architecture: " + instance.architecture);
        lines.push_back("Platform: " + instance.platform.value_or("Linux/Unix"));

        lines.emplace_back("");
        lines.emplace_back("Network Details:");
        lines.push_back("  VPC ID: " + instance.vpcId);
        lines.push_back("  Subnet ID: " + instance.subnetId);
        lines.push_back("  Private IP: " + instance.privateIpAddress);
        if (instance.publicIpAddress)
            lines.push_back("  Public IP: " + *instance.publicIpAddress);
        lines.push_back("  Private DNS: " + instance.privateDnsName);
        if (instance.publicDnsName)
            lines.push_back("  Public DNS: " + *instance.publicDnsName);

        lines.emplace_back("");
        lines.emplace_back("Security Groups:");
        for (auto& group : instance.securityGroups)
            lines.push_back("  - " + group.groupName + " (" + group.groupId + ")");

        lines.emplace_back("");
        lines.emplace_back("Tags:");
        if (instance.tags.empty())
            lines.emplace_back("  No tags found");
        for (auto& tag : instance.tags)
            lines.push_back("  " + tag.key + ": " + tag.value);

        renderStorage(instance, lines);

        lines.emplace_back("");
        lines.push_back("Availability Zone: " + instance.placement.availabilityZone);
        if (instance.keyName)
            lines.push_back("Key Pair: " + *instance.keyName);
    }
    return lines;
}
//---------------------------------------------------------------------------
vector<string> ReportAssembler::summary(const ReportResult& result)
// The console summary
{
    vector<string> lines;
    lines.push_back("Found " + to_string(result.instanceCount()) + " instance(s)");
    for (size_t i = 0; i < result.instances.size(); i++)
        lines.push_back("  Instance " + to_string(i + 1) + ": " + result.instances[i].instanceId + " (" + result.instances[i].state.name + ")");
    return lines;
}
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
