#include "lookup/enrichment_merger.hpp"
#include "lookup/lookup_error.hpp"
#include "lookup/pipeline.hpp"
#include "lookup/report_assembler.hpp"
#include "../fakes.hpp"
#include <algorithm>
#include <catch2/catch.hpp>
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
namespace test {
//---------------------------------------------------------------------------
using namespace std;
using namespace ec2scout::test;
//---------------------------------------------------------------------------
TEST_CASE("pipeline_not_found") {
    FakeEC2Api api;
    LookupPipeline pipeline(api);
    REQUIRE(!pipeline.run("missing"));
    REQUIRE(api.instanceCalls.size() == 1);
    REQUIRE(api.volumeCalls.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("pipeline_single_instance") {
    FakeEC2Api api;
    api.reservations.push_back(makeReservation({makeInstance("i-1", "web-01", {{"/dev/xvda", "vol-A"}, {"/dev/sdb", ""}})}));
    api.volumes = {makeVolume("vol-A", 8)};

    LookupPipeline pipeline(api);
    auto result = pipeline.run("web-01", "us-west-2");
    REQUIRE(result);
    REQUIRE(result->region == "us-west-2");
    REQUIRE(result->instanceCount() == 1);
    REQUIRE(result->timestamp == "2024-01-15 10:30:00+00:00");
    REQUIRE(api.volumeCalls.size() == 1);
    REQUIRE(api.volumeCalls[0] == pair<string, vector<string>>{"us-west-2", {"vol-A"}});

    auto& instance = result->instances[0];
    REQUIRE(instance.volumeDetails.size() == 1);
    REQUIRE(instance.volumeDetails.at("vol-A").size == 8);
    REQUIRE(EnrichmentMerger::attachmentStatus(instance, instance.blockDeviceMappings[1]) == AttachmentStatus::Ephemeral);
}
//---------------------------------------------------------------------------
TEST_CASE("pipeline_shared_volume") {
    FakeEC2Api api;
    api.reservations.push_back(makeReservation({makeInstance("i-1", "web-01", {{"/dev/xvda", "vol-A"}, {"/dev/xvdf", "vol-shared"}})}));
    api.reservations.push_back(makeReservation({makeInstance("i-2", "web-01", {{"/dev/xvda", "vol-B"}, {"/dev/xvdf", "vol-shared"}})}));
    api.volumes = {makeVolume("vol-A", 8), makeVolume("vol-B", 16), makeVolume("vol-shared", 500)};

    LookupPipeline pipeline(api);
    auto result = pipeline.run("web-01");
    REQUIRE(result);
    REQUIRE(result->region == "ap-southeast-2");
    REQUIRE(result->instanceCount() == 2);
    REQUIRE(api.volumeCalls.size() == 1);
    REQUIRE(api.volumeCalls[0].second == vector<string>{"vol-A", "vol-B", "vol-shared"});

    auto& first = result->instances[0];
    auto& second = result->instances[1];
    REQUIRE(first.instanceId == "i-1");
    REQUIRE(second.instanceId == "i-2");
    REQUIRE(first.volumeDetails.contains("vol-A"));
    REQUIRE(!first.volumeDetails.contains("vol-B"));
    REQUIRE(second.volumeDetails.contains("vol-B"));
    REQUIRE(!second.volumeDetails.contains("vol-A"));
    REQUIRE(first.volumeDetails.at("vol-shared") == second.volumeDetails.at("vol-shared"));
}
//---------------------------------------------------------------------------
TEST_CASE("pipeline_deterministic") {
    FakeEC2Api api;
    api.reservations.push_back(makeReservation({makeInstance("i-1", "web-01", {{"/dev/xvda", "vol-A"}}), makeInstance("i-2", "web-01", {{"/dev/xvda", "vol-B"}})}));
    api.volumes = {makeVolume("vol-B", 16), makeVolume("vol-A", 8)};

    LookupPipeline pipeline(api);
    auto first = pipeline.run("web-01");
    auto second = pipeline.run("web-01");
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(ReportAssembler::serialize(*first) == ReportAssembler::serialize(*second));
}
//---------------------------------------------------------------------------
TEST_CASE("pipeline_volume_failure") {
    FakeEC2Api api;
    api.reservations.push_back(makeReservation({makeInstance("i-1", "web-01", {{"/dev/xvda", "vol-A"}}), makeInstance("i-2", "web-01", {{"/dev/xvda", "vol-B"}})}));
    api.volumesError = "The volume 'vol-B' does not exist.";

    LookupPipeline pipeline(api);
    auto result = pipeline.run("web-01");
    REQUIRE(result);
    REQUIRE(result->instanceCount() == 2);
    for (auto& instance : result->instances) {
        REQUIRE(instance.volumeDetails.empty());
        REQUIRE(EnrichmentMerger::attachmentStatus(instance, instance.blockDeviceMappings[0]) == AttachmentStatus::Unresolved);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("pipeline_instance_store_only") {
    FakeEC2Api api;
    api.reservations.push_back(makeReservation({makeInstance("i-1", "cache-01", {{"/dev/sdb", ""}, {"/dev/sdc", ""}})}));

    LookupPipeline pipeline(api);
    auto result = pipeline.run("cache-01");
    REQUIRE(result);
    REQUIRE(api.volumeCalls.empty());
    REQUIRE(result->instances[0].volumeDetails.empty());

    auto lines = ReportAssembler::render(result->instances);
    REQUIRE(find(lines.begin(), lines.end(), "  /dev/sdb: Instance store volume") != lines.end());
    REQUIRE(find(lines.begin(), lines.end(), "  /dev/sdc: Instance store volume") != lines.end());
    for (auto& line : lines)
        REQUIRE(line.find("details unavailable") == string::npos);
}
//---------------------------------------------------------------------------
TEST_CASE("pipeline_lookup_failure") {
    FakeEC2Api api;
    api.instancesError = "RequestExpired: Request has expired.";

    LookupPipeline pipeline(api);
    REQUIRE_THROWS_AS(pipeline.run("web-01"), LookupError);
    REQUIRE(api.volumeCalls.empty());
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace lookup
} // namespace ec2scout
