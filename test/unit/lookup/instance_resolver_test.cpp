#include "lookup/instance_resolver.hpp"
#include "lookup/lookup_error.hpp"
#include "../fakes.hpp"
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
TEST_CASE("instance_resolver_filters") {
    FakeEC2Api api;
    InstanceResolver resolver(api);
    REQUIRE(resolver.resolve("web-01").empty());

    REQUIRE(api.instanceCalls.size() == 1);
    auto& [region, filters] = api.instanceCalls[0];
    REQUIRE(region == "ap-southeast-2");
    REQUIRE(filters.size() == 2);
    REQUIRE(filters[0].name == "tag:Name");
    REQUIRE(filters[0].values == vector<string>{"web-01"});
    REQUIRE(filters[1].name == "instance-state-name");
    REQUIRE(filters[1].values == vector<string>{"running", "stopped", "stopping", "pending", "shutting-down"});

    REQUIRE(resolver.resolve("web-01", "us-east-1").empty());
    REQUIRE(api.instanceCalls[1].first == "us-east-1");
    REQUIRE(InstanceResolver::effectiveRegion(""s) == "ap-southeast-2");
}
//---------------------------------------------------------------------------
TEST_CASE("instance_resolver_flattens_reservations") {
    FakeEC2Api api;
    api.reservations.push_back(makeReservation({makeInstance("i-1", "web-01"), makeInstance("i-2", "web-01")}));
    api.reservations.push_back(makeReservation({makeInstance("i-3", "web-01")}));

    InstanceResolver resolver(api);
    auto instances = resolver.resolve("web-01");
    REQUIRE(instances.size() == 3);
    REQUIRE(instances[0].instanceId == "i-1");
    REQUIRE(instances[1].instanceId == "i-2");
    REQUIRE(instances[2].instanceId == "i-3");
}
//---------------------------------------------------------------------------
TEST_CASE("instance_resolver_failure") {
    FakeEC2Api api;
    api.reservations.push_back(makeReservation({makeInstance("i-1", "web-01")}));
    api.instancesError = "AuthFailure: AWS was not able to validate the provided access credentials";

    InstanceResolver resolver(api);
    REQUIRE_THROWS_AS(resolver.resolve("web-01"), LookupError);
    REQUIRE_THROWS_WITH(resolver.resolve("web-01"), "AuthFailure: AWS was not able to validate the provided access credentials");
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace lookup
} // namespace ec2scout
