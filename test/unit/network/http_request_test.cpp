#include "network/http_request.hpp"
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
namespace network {
namespace test {
//---------------------------------------------------------------------------
TEST_CASE("http_request") {
    network::HttpRequest request;

    request.method = network::HttpRequest::Method::GET;
    request.type = network::HttpRequest::Type::HTTP_1_1;
    request.queries.emplace("Version", "2016-11-15");
    request.queries.emplace("Action", "DescribeInstances");
    request.queries.emplace("Filter.1.Name", "tag:Name");
    request.queries.emplace("Filter.1.Value.1", "web 01");
    request.headers.emplace("Host", "ec2.ap-southeast-2.amazonaws.com");
    request.headers.emplace("x-amz-date", "21000101T000000Z");

    REQUIRE(network::HttpRequest::encodeQueries(request.queries) == "Action=DescribeInstances&Filter.1.Name=tag%3AName&Filter.1.Value.1=web%2001&Version=2016-11-15");

    auto serialized = network::HttpRequest::serialize(request);
    std::string expected = "GET /?Action=DescribeInstances&Filter.1.Name=tag%3AName&Filter.1.Value.1=web%2001&Version=2016-11-15 HTTP/1.1\r\n"
                           "Host: ec2.ap-southeast-2.amazonaws.com\r\n"
                           "x-amz-date: 21000101T000000Z\r\n\r\n";
    REQUIRE(serialized == expected);
}
//---------------------------------------------------------------------------
TEST_CASE("http_request_body") {
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::PUT;
    request.path = "/latest/api/token";
    request.headers.emplace("Content-Length", "4");
    request.body = "body";

    REQUIRE(network::HttpRequest::encodeQueries(request.queries).empty());
    REQUIRE(network::HttpRequest::serialize(request) == "PUT /latest/api/token HTTP/1.1\r\nContent-Length: 4\r\n\r\nbody");
    REQUIRE(std::string(network::HttpRequest::getRequestMethod(network::HttpRequest::Method::DELETE)) == "DELETE");
    REQUIRE(std::string(network::HttpRequest::getRequestType(network::HttpRequest::Type::HTTP_1_0)) == "HTTP/1.0");
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace network
} // namespace ec2scout
