#include "cloud/ec2_parser.hpp"
#include "utils/xml_reader.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
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
namespace cloud {
//---------------------------------------------------------------------------
using namespace std;
using utils::XmlReader;
using nlohmann::ordered_json;
//---------------------------------------------------------------------------
/// The instance fields with a dedicated member
static constexpr array<string_view, 23> modelledInstanceFields = {
    "instanceId", "imageId", "instanceType", "instanceState", "launchTime", "architecture", "platform", "platformDetails",
    "vpcId", "subnetId", "privateIpAddress", "ipAddress", "privateDnsName", "dnsName", "groupSet", "tagSet",
    "rootDeviceName", "rootDeviceType", "virtualizationType", "hypervisor", "ebsOptimized", "blockDeviceMapping", "keyName"};
//---------------------------------------------------------------------------
string_view EC2Parser::root(string_view xml, string_view expected)
// Find the root element
{
    auto elements = XmlReader::elements(xml);
    if (elements.empty())
        throw runtime_error("Invalid EC2 response: No root element!");
    auto& element = elements.front();
    if (element.name == "Response")
        throw parseError(xml, 200);
    if (element.name != expected)
        throw runtime_error("Invalid EC2 response: Unexpected root element " + string(element.name) + "!");
    return element.content;
}
//---------------------------------------------------------------------------
int64_t EC2Parser::parseInteger(string_view value, string_view field)
// Parse a number
{
    int64_t result = 0;
    auto [ptr, ec] = from_chars(value.data(), value.data() + value.size(), result);
    if (ec != errc() || ptr != value.data() + value.size())
        throw runtime_error("Invalid EC2 response: Bad number in " + string(field) + "!");
    return result;
}
//---------------------------------------------------------------------------
bool EC2Parser::parseBool(string_view content, string_view field)
// Parse a flag
{
    auto value = XmlReader::child(content, field);
    if (!value)
        return false;
    if (*value == "true")
        return true;
    if (*value == "false")
        return false;
    throw runtime_error("Invalid EC2 response: Bad flag in " + string(field) + "!");
}
//---------------------------------------------------------------------------
string EC2Parser::fieldName(string_view tag)
// Map the query API tag to the DescribeInstances JSON name
{
    if (tag == "reason")
        return "StateTransitionReason";
    string name(tag);
    if (name.size() > 3 && name.ends_with("Set")) {
        name.resize(name.size() - 3);
        if (!name.ends_with('s'))
            name += 's';
    }
    if (!name.empty())
        name[0] = static_cast<char>(toupper(static_cast<unsigned char>(name[0])));
    return name;
}
//---------------------------------------------------------------------------
ordered_json EC2Parser::convertElement(string_view name, string_view content)
// Generic conversion, booleans are typed and all other text stays a string
{
    auto children = XmlReader::elements(content);
    if (children.empty()) {
        if (name.ends_with("Set") || name == "productCodes")
            return ordered_json::array();
        auto text = XmlReader::decode(content);
        if (text == "true")
            return true;
        if (text == "false")
            return false;
        return text;
    }

    auto isList = all_of(children.begin(), children.end(), [](const XmlReader::Element& child) { return child.name == "item"; });
    if (isList) {
        auto list = ordered_json::array();
        for (auto& child : children)
            list.push_back(convertElement(child.name, child.content));
        return list;
    }

    auto object = ordered_json::object();
    for (auto& child : children)
        object[fieldName(child.name)] = convertElement(child.name, child.content);
    return object;
}
//---------------------------------------------------------------------------
Instance EC2Parser::parseInstance(string_view item)
// Parse the instance
{
    Instance instance;
    instance.instanceId = XmlReader::text(item, "instanceId");
    instance.imageId = XmlReader::text(item, "imageId");
    instance.instanceType = XmlReader::text(item, "instanceType");
    if (auto state = XmlReader::child(item, "instanceState")) {
        auto code = XmlReader::text(*state, "code", "0");
        instance.state.code = static_cast<int32_t>(parseInteger(code, "instanceState.code"));
        instance.state.name = XmlReader::text(*state, "name");
    }
    instance.launchTime = XmlReader::text(item, "launchTime");
    instance.architecture = XmlReader::text(item, "architecture");
    instance.platform = XmlReader::optionalText(item, "platform");
    instance.platformDetails = XmlReader::text(item, "platformDetails");
    instance.vpcId = XmlReader::text(item, "vpcId");
    instance.subnetId = XmlReader::text(item, "subnetId");
    instance.privateIpAddress = XmlReader::text(item, "privateIpAddress");
    instance.publicIpAddress = XmlReader::optionalText(item, "ipAddress");
    instance.privateDnsName = XmlReader::text(item, "privateDnsName");
    instance.publicDnsName = XmlReader::optionalText(item, "dnsName");

    for (auto group : XmlReader::items(item, "groupSet"))
        instance.securityGroups.push_back({XmlReader::text(group, "groupId"), XmlReader::text(group, "groupName")});
    for (auto tag : XmlReader::items(item, "tagSet"))
        instance.tags.push_back({XmlReader::text(tag, "key"), XmlReader::text(tag, "value")});

    if (auto placement = XmlReader::child(item, "placement")) {
        instance.placement.availabilityZone = XmlReader::text(*placement, "availabilityZone");
        instance.placement.tenancy = XmlReader::text(*placement, "tenancy");
    }
    instance.rootDeviceName = XmlReader::text(item, "rootDeviceName");
    instance.rootDeviceType = XmlReader::text(item, "rootDeviceType");
    instance.virtualizationType = XmlReader::text(item, "virtualizationType");
    instance.hypervisor = XmlReader::text(item, "hypervisor");
    instance.ebsOptimized = parseBool(item, "ebsOptimized");
    if (auto monitoring = XmlReader::child(item, "monitoring"))
        instance.monitoringState = XmlReader::text(*monitoring, "state");

    for (auto mapping : XmlReader::items(item, "blockDeviceMapping")) {
        BlockDeviceMapping device;
        device.deviceName = XmlReader::text(mapping, "deviceName");
        if (auto ebs = XmlReader::child(mapping, "ebs")) {
            EbsAttachment attachment;
            attachment.volumeId = XmlReader::text(*ebs, "volumeId");
            attachment.status = XmlReader::text(*ebs, "status");
            attachment.attachTime = XmlReader::text(*ebs, "attachTime");
            attachment.deleteOnTermination = parseBool(*ebs, "deleteOnTermination");
            device.ebs = move(attachment);
        }
        instance.blockDeviceMappings.push_back(move(device));
    }
    instance.keyName = XmlReader::optionalText(item, "keyName");

    // Placement and monitoring are only partially modelled, their remaining children are merged on output
    for (auto& element : XmlReader::elements(item))
        if (find(modelledInstanceFields.begin(), modelledInstanceFields.end(), element.name) == modelledInstanceFields.end())
            instance.additionalFields[fieldName(element.name)] = convertElement(element.name, element.content);
    return instance;
}
//---------------------------------------------------------------------------
vector<Reservation> EC2Parser::parseReservations(string_view xml)
// Parse the reservations
{
    auto content = root(xml, "DescribeInstancesResponse");
    vector<Reservation> reservations;
    for (auto item : XmlReader::items(content, "reservationSet")) {
        Reservation reservation;
        reservation.reservationId = XmlReader::text(item, "reservationId");
        reservation.ownerId = XmlReader::text(item, "ownerId");
        for (auto instance : XmlReader::items(item, "instancesSet"))
            reservation.instances.push_back(parseInstance(instance));
        reservations.push_back(move(reservation));
    }
    return reservations;
}
//---------------------------------------------------------------------------
Volume EC2Parser::parseVolume(string_view item)
// Parse the volume
{
    Volume volume;
    volume.volumeId = XmlReader::text(item, "volumeId");
    volume.size = parseInteger(XmlReader::text(item, "size", "0"), "size");
    volume.volumeType = XmlReader::text(item, "volumeType");
    volume.state = XmlReader::text(item, "status");
    volume.encrypted = parseBool(item, "encrypted");
    if (auto iops = XmlReader::optionalText(item, "iops"))
        volume.iops = parseInteger(*iops, "iops");
    if (auto throughput = XmlReader::optionalText(item, "throughput"))
        volume.throughput = parseInteger(*throughput, "throughput");
    volume.snapshotId = XmlReader::optionalText(item, "snapshotId");
    volume.availabilityZone = XmlReader::text(item, "availabilityZone");
    volume.createTime = XmlReader::text(item, "createTime");
    volume.multiAttachEnabled = parseBool(item, "multiAttachEnabled");
    return volume;
}
//---------------------------------------------------------------------------
vector<Volume> EC2Parser::parseVolumes(string_view xml)
// Parse the volumes
{
    auto content = root(xml, "DescribeVolumesResponse");
    vector<Volume> volumes;
    for (auto item : XmlReader::items(content, "volumeSet"))
        volumes.push_back(parseVolume(item));
    return volumes;
}
//---------------------------------------------------------------------------
string EC2Parser::nextToken(string_view xml)
// The pagination token
{
    auto elements = XmlReader::elements(xml);
    if (elements.empty())
        return "";
    return XmlReader::text(elements.front().content, "nextToken");
}
//---------------------------------------------------------------------------
EC2Error EC2Parser::parseError(string_view xml, uint16_t status)
// Decode <Response><Errors><Error><Code/><Message/></Error></Errors></Response>
{
    auto fallback = EC2Error("HttpError", "Request failed with status " + to_string(status));
    try {
        auto response = XmlReader::child(xml, "Response");
        if (!response)
            return fallback;
        auto errors = XmlReader::child(*response, "Errors");
        if (!errors)
            return fallback;
        auto error = XmlReader::child(*errors, "Error");
        if (!error)
            return fallback;
        auto code = XmlReader::text(*error, "Code");
        if (code.empty())
            return fallback;
        return EC2Error(code, XmlReader::text(*error, "Message"));
    } catch (const runtime_error&) {
        // Not an XML error document, e.g. a proxy error page
        return fallback;
    }
}
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace ec2scout
