#include "app/application.hpp"
#include "../fakes.hpp"
#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>
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
namespace app {
namespace test {
//---------------------------------------------------------------------------
using namespace std;
using namespace ec2scout::test;
//---------------------------------------------------------------------------
/// A scratch directory removed on destruction
struct ScratchDirectory {
    filesystem::path path;

    ScratchDirectory() : path(filesystem::temp_directory_path() / ("ec2scout_test_" + to_string(getpid()))) {
        filesystem::remove_all(path);
    }
    ~ScratchDirectory() {
        error_code ec;
        filesystem::remove_all(path, ec);
    }
};
//---------------------------------------------------------------------------
static Options makeOptions(const string& serverName)
// Options for the server
{
    Options options;
    options.serverName = serverName;
    return options;
}
//---------------------------------------------------------------------------
TEST_CASE("application_not_found") {
    ScratchDirectory scratch;
    FakeEC2Api api;
    auto options = makeOptions("missing");
    options.output = (scratch.path / "missing.json").string();

    stringstream out, err;
    REQUIRE(Application::run(options, api, out, err) == Application::exitSuccess);
    REQUIRE(out.str() == "Searching for EC2 instance: missing\nRegion: ap-southeast-2 (default)\nNo EC2 instances found with name: missing\n");
    REQUIRE(err.str().empty());
    REQUIRE(!filesystem::exists(*options.output));
}
//---------------------------------------------------------------------------
TEST_CASE("application_lookup_failure") {
    FakeEC2Api api;
    api.instancesError = "AuthFailure: invalid credentials";
    auto options = makeOptions("web-01");
    options.region = "us-east-1";

    stringstream out, err;
    REQUIRE(Application::run(options, api, out, err) == Application::exitFailure);
    REQUIRE(out.str() == "Searching for EC2 instance: web-01\nRegion: us-east-1\n");
    REQUIRE(err.str() == "Error retrieving EC2 details: AuthFailure: invalid credentials\n");
}
//---------------------------------------------------------------------------
TEST_CASE("application_human") {
    FakeEC2Api api;
    api.reservations.push_back(makeReservation({makeInstance("i-1", "web-01", {{"/dev/xvda", "vol-A"}})}));
    api.volumes = {makeVolume("vol-A", 8)};
    auto options = makeOptions("web-01");
    options.human = true;

    stringstream out, err;
    REQUIRE(Application::run(options, api, out, err) == Application::exitSuccess);
    auto text = out.str();
    REQUIRE(text.find("Instance ID: i-1\n") != string::npos);
    REQUIRE(text.find("  /dev/xvda: vol-A\n    Size: 8 GB\n") != string::npos);
    REQUIRE(text.find("EC2 details written to") == string::npos);
}
//---------------------------------------------------------------------------
TEST_CASE("application_json") {
    ScratchDirectory scratch;
    FakeEC2Api api;
    api.reservations.push_back(makeReservation({makeInstance("i-1", "web-01", {{"/dev/xvda", "vol-A"}}), makeInstance("i-2", "web-01")}));
    api.volumes = {makeVolume("vol-A", 8)};
    auto options = makeOptions("web-01");
    auto path = scratch.path / "reports" / "web-01.json";
    options.output = path.string();

    stringstream out, err;
    REQUIRE(Application::run(options, api, out, err) == Application::exitSuccess);
    REQUIRE(out.str() == "Searching for EC2 instance: web-01\nRegion: ap-southeast-2 (default)\nEC2 details written to: " + path.string() + "\nFound 2 instance(s)\n  Instance 1: i-1 (running)\n  Instance 2: i-2 (running)\n");

    ifstream file(path);
    REQUIRE(file);
    auto json = nlohmann::json::parse(file);
    REQUIRE(json["search_query"] == "web-01");
    REQUIRE(json["region"] == "ap-southeast-2");
    REQUIRE(json["timestamp"] == "2024-01-15 10:30:00+00:00");
    REQUIRE(json["instance_count"] == 2);
    REQUIRE(json["instances"].size() == 2);
    REQUIRE(json["instances"][0]["VolumeDetails"]["vol-A"]["Size"] == 8);
}
//---------------------------------------------------------------------------
TEST_CASE("application_write_failure") {
    ScratchDirectory scratch;
    filesystem::create_directories(scratch.path);
    {
        ofstream blocker(scratch.path / "file");
        blocker << "x";
    }
    FakeEC2Api api;
    api.reservations.push_back(makeReservation({makeInstance("i-1", "web-01")}));
    auto options = makeOptions("web-01");
    options.output = (scratch.path / "file" / "report.json").string();

    stringstream out, err;
    REQUIRE(Application::run(options, api, out, err) == Application::exitFailure);
    REQUIRE(err.str().starts_with("Error writing EC2 details: "));
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace app
} // namespace ec2scout
