#include "cloud/aws_signer.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
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
//---------------------------------------------------------------------------
TEST_CASE("aws_signer") {
    // The GET example of the signature version 4 documentation
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::GET;
    request.path = "/";
    request.queries.emplace("Action", "ListUsers");
    request.queries.emplace("Version", "2010-05-08");
    request.headers.emplace("Content-Type", "application/x-www-form-urlencoded; charset=utf-8");
    request.headers.emplace("Host", "iam.amazonaws.com");
    request.headers.emplace("x-amz-date", "20150830T123600Z");

    AWSSigner::StringToSign stringToSign = {.request = request, .region = "us-east-1", .service = "iam", .requestSHA = "", .signedHeaders = "", .payloadHash = ""};
    AWSSigner::encodeCanonicalRequest(request, stringToSign);
    REQUIRE(stringToSign.payloadHash == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(stringToSign.signedHeaders == "content-type;host;x-amz-date");
    REQUIRE(stringToSign.requestSHA == "f536975d06c0309214f805bb90ccff089219ecd68b2577efef23edd43b7e1a59");

    string signedHeaders;
    auto canonical = AWSSigner::createCanonicalRequest(request, signedHeaders, stringToSign.payloadHash);
    REQUIRE(canonical == "GET\n/\nAction=ListUsers&Version=2010-05-08\ncontent-type:application/x-www-form-urlencoded; charset=utf-8\nhost:iam.amazonaws.com\nx-amz-date:20150830T123600Z\n\ncontent-type;host;x-amz-date\ne3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    auto authorization = AWSSigner::createSignedRequest("AKIDEXAMPLE", "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY", stringToSign);
    string expected = "AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20150830/us-east-1/iam/aws4_request, SignedHeaders=content-type;host;x-amz-date, Signature=5d672d79c15b13162d9279b0855cfba6789a8edb4c82c400e06b5924a6f2b5d7";
    REQUIRE(authorization == expected);
    REQUIRE(request.headers.at("Authorization") == expected);
}
//---------------------------------------------------------------------------
TEST_CASE("aws_signer_missing_date") {
    network::HttpRequest request;
    request.headers.emplace("Host", "ec2.us-east-1.amazonaws.com");
    AWSSigner::StringToSign stringToSign = {.request = request, .region = "us-east-1", .service = "ec2", .requestSHA = "", .signedHeaders = "", .payloadHash = ""};
    AWSSigner::encodeCanonicalRequest(request, stringToSign);
    REQUIRE_THROWS_AS(AWSSigner::createSignedRequest("ABC", "ABC", stringToSign), runtime_error);
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace cloud
} // namespace ec2scout
