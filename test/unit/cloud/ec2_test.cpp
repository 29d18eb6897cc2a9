#include "cloud/ec2.hpp"
#include "../fakes.hpp"
#include "ec2_responses.hpp"
#include <catch2/catch.hpp>
#include <string>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2scout {
namespace cloud {
namespace test {
//---------------------------------------------------------------------------
using namespace std;
using ec2scout::test::FakeTransport;
//---------------------------------------------------------------------------
// Helper to test private methods
class EC2Tester {
    public:
    void settings() {
        FakeTransport transport;
        AWSCredentials credentials(transport, "ABC", "ABC");
        EC2 defaults(transport, credentials);
        REQUIRE(defaults._settings.endpoint.empty());
        REQUIRE(defaults._settings.port == 443);
        REQUIRE(defaults._settings.https);

        EC2::Settings custom;
        custom.endpoint = "localhost";
        custom.port = 80;
        custom.https = false;
        EC2 local(transport, credentials, custom);
        REQUIRE(local.getAddress("eu-west-1") == "localhost");
        REQUIRE(local.getEndpoint("eu-west-1").port == 80);
    }

    void signing() {
        EC2::testEnvironment = true;

        FakeTransport transport;
        AWSCredentials credentials(transport, "ABC", "ABC");
        EC2 ec2(transport, credentials);

        auto endpoint = ec2.getEndpoint("ap-southeast-2");
        REQUIRE(endpoint.host == "ec2.ap-southeast-2.amazonaws.com");
        REQUIRE(endpoint.port == 443);
        REQUIRE(endpoint.https);
        REQUIRE(ec2.getAddress("ap-southeast-2") == "ec2.ap-southeast-2.amazonaws.com");

        vector<Filter> filters = {{"tag:Name", {"web-01"}}, {"instance-state-name", {"running", "stopped", "stopping", "pending", "shutting-down"}}};
        auto request = ec2.buildRequest("ap-southeast-2", EC2::describeInstancesQueries(filters));
        string resultString = "GET /?Action=DescribeInstances&Filter.1.Name=tag%3AName&Filter.1.Value.1=web-01&Filter.2.Name=instance-state-name&Filter.2.Value.1=running&Filter.2.Value.2=stopped&Filter.2.Value.3=stopping&Filter.2.Value.4=pending&Filter.2.Value.5=shutting-down&Version=2016-11-15 HTTP/1.1\r\n";
        resultString += "Authorization: AWS4-HMAC-SHA256 Credential=ABC/21000101/ap-southeast-2/ec2/aws4_request, SignedHeaders=host;x-amz-date, Signature=244894ee310a07e99fc470c259f967a017018505a3336b5de869ff03eabba0e0\r\n";
        resultString += "Host: ec2.ap-southeast-2.amazonaws.com\r\nx-amz-date: ";
        resultString += ec2.fakeAMZTimestamp;
        resultString += "\r\n\r\n";
        REQUIRE(network::HttpRequest::serialize(request) == resultString);

        // Custom endpoint with session token
        AWSCredentials sessionCredentials(transport, "ABC", "ABC", "TOKEN");
        EC2 local(transport, sessionCredentials, {.endpoint = "localhost", .port = 4566, .https = false});
        REQUIRE(local.getAddress("us-east-1") == "localhost:4566");
        REQUIRE(!local.getEndpoint("us-east-1").https);
        auto volumeRequest = local.buildRequest("us-east-1", EC2::describeVolumesQueries({"vol-A", "vol-B"}));
        REQUIRE(volumeRequest.headers.at("x-amz-security-token") == "TOKEN");
        REQUIRE(volumeRequest.headers.at("Authorization") == "AWS4-HMAC-SHA256 Credential=ABC/21000101/us-east-1/ec2/aws4_request, SignedHeaders=host;x-amz-date;x-amz-security-token, Signature=031791fd3bfe9bb89043d2da49d74fc43fd41d655ffda9bccdae4bc30248458e");

        EC2::testEnvironment = false;
    }

    void pagination() {
        FakeTransport transport;
        AWSCredentials credentials(transport, "ABC", "ABC");
        EC2 ec2(transport, credentials);

        transport.respond(200, describeInstancesPage1);
        transport.respond(200, describeInstancesPage2);
        auto reservations = ec2.describeInstances("ap-southeast-2", {{"tag:Name", {"web-01"}}});
        REQUIRE(reservations.size() == 2);
        REQUIRE(reservations[0].instances.at(0).instanceId == "i-0aaa");
        REQUIRE(reservations[1].instances.at(0).instanceId == "i-0bbb");

        REQUIRE(transport.exchanges.size() == 2);
        REQUIRE(!transport.exchanges[0].request.queries.contains("NextToken"));
        REQUIRE(transport.exchanges[1].request.queries.at("NextToken") == "token-2");
        REQUIRE(transport.exchanges[1].endpoint.host == "ec2.ap-southeast-2.amazonaws.com");
        REQUIRE(transport.exchanges[1].request.headers.contains("Authorization"));
    }

    void volumes() {
        FakeTransport transport;
        AWSCredentials credentials(transport, "ABC", "ABC");
        EC2 ec2(transport, credentials);

        transport.respond(200, describeVolumes);
        auto volumes = ec2.describeVolumes("ap-southeast-2", {"vol-A", "vol-B"});
        REQUIRE(volumes.size() == 2);
        auto& queries = transport.exchanges.at(0).request.queries;
        REQUIRE(queries.at("Action") == "DescribeVolumes");
        REQUIRE(queries.at("VolumeId.1") == "vol-A");
        REQUIRE(queries.at("VolumeId.2") == "vol-B");
        REQUIRE(queries.at("Version") == "2016-11-15");
    }

    void errors() {
        FakeTransport transport;
        AWSCredentials credentials(transport, "ABC", "ABC");
        EC2 ec2(transport, credentials);

        transport.respond(401, authFailure);
        try {
            auto volumes = ec2.describeVolumes("ap-southeast-2", {"vol-A"});
            FAIL("expected an EC2Error, got " << volumes.size() << " volumes");
        } catch (const EC2Error& e) {
            REQUIRE(e.code() == "AuthFailure");
        }

        // A failing later page fails the whole call
        transport.respond(200, describeInstancesPage1);
        transport.fail("connection reset");
        REQUIRE_THROWS_WITH(ec2.describeInstances("ap-southeast-2", {}), "connection reset");
    }
};
//---------------------------------------------------------------------------
TEST_CASE("ec2_settings") {
    EC2Tester tester;
    tester.settings();
}
//---------------------------------------------------------------------------
TEST_CASE("ec2_signing") {
    EC2Tester tester;
    tester.signing();
}
//---------------------------------------------------------------------------
TEST_CASE("ec2_pagination") {
    EC2Tester tester;
    tester.pagination();
}
//---------------------------------------------------------------------------
TEST_CASE("ec2_volumes") {
    EC2Tester tester;
    tester.volumes();
}
//---------------------------------------------------------------------------
TEST_CASE("ec2_errors") {
    EC2Tester tester;
    tester.errors();
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace cloud
} // namespace ec2scout
