#include "cloud/ec2.hpp"
#include "cloud/aws_signer.hpp"
#include "cloud/ec2_parser.hpp"
#include "network/http_response.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// Dominik Durner, 2021
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2scout {
namespace cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
bool EC2::testEnvironment = false;
//---------------------------------------------------------------------------
static string buildAMZTimestamp()
// Creates the AWS timestamp
{
    stringstream s;
    const auto t = chrono::system_clock::to_time_t(chrono::system_clock::now());
    tm time{};
    gmtime_r(&t, &time);
    s << put_time(&time, "%Y%m%dT%H%M%SZ");
    return s.str();
}
//---------------------------------------------------------------------------
network::Endpoint EC2::getEndpoint(const string& region) const
// The regional endpoint
{
    network::Endpoint endpoint;
    endpoint.host = _settings.endpoint.empty() ? "ec2." + region + ".amazonaws.com" : _settings.endpoint;
    endpoint.port = _settings.port;
    endpoint.https = _settings.https;
    return endpoint;
}
//---------------------------------------------------------------------------
string EC2::getAddress(const string& region) const
// The host header
{
    auto endpoint = getEndpoint(region);
    if ((endpoint.https && endpoint.port == 443) || (!endpoint.https && endpoint.port == 80))
        return endpoint.host;
    return endpoint.host + ":" + to_string(endpoint.port);
}
//---------------------------------------------------------------------------
map<string, string> EC2::describeInstancesQueries(const vector<Filter>& filters)
// The filter parameters, Filter.N.Name and Filter.N.Value.M
{
    map<string, string> queries;
    queries.emplace("Action", "DescribeInstances");
    for (size_t i = 0; i < filters.size(); i++) {
        auto prefix = "Filter." + to_string(i + 1);
        queries.emplace(prefix + ".Name", filters[i].name);
        for (size_t j = 0; j < filters[i].values.size(); j++)
            queries.emplace(prefix + ".Value." + to_string(j + 1), filters[i].values[j]);
    }
    return queries;
}
//---------------------------------------------------------------------------
map<string, string> EC2::describeVolumesQueries(const vector<string>& volumeIds)
// The volume parameters, VolumeId.N
{
    map<string, string> queries;
    queries.emplace("Action", "DescribeVolumes");
    for (size_t i = 0; i < volumeIds.size(); i++)
        queries.emplace("VolumeId." + to_string(i + 1), volumeIds[i]);
    return queries;
}
//---------------------------------------------------------------------------
network::HttpRequest EC2::buildRequest(const string& region, map<string, string> queries) const
// Creates and signs the request
{
    auto& secret = _credentials.getSecret();

    network::HttpRequest request;
    request.method = network::HttpRequest::Method::GET;
    request.type = network::HttpRequest::Type::HTTP_1_1;
    request.path = "/";
    request.queries = move(queries);
    request.queries.emplace("Version", apiVersion);
    request.headers.emplace("Host", getAddress(region));
    request.headers.emplace("x-amz-date", testEnvironment ? fakeAMZTimestamp : buildAMZTimestamp());
    if (!secret.token.empty())
        request.headers.emplace("x-amz-security-token", secret.token);

    AWSSigner::StringToSign stringToSign = {.request = request, .region = region, .service = "ec2", .requestSHA = "", .signedHeaders = "", .payloadHash = ""};
    AWSSigner::encodeCanonicalRequest(request, stringToSign);
    AWSSigner::createSignedRequest(secret.keyId, secret.secret, stringToSign);
    return request;
}
//---------------------------------------------------------------------------
string EC2::execute(const string& region, const map<string, string>& queries)
// Sends the request
{
    auto response = _transport.execute(getEndpoint(region), buildRequest(region, queries));
    if (!network::HttpResponse::checkSuccess(response.header.code))
        throw EC2Parser::parseError(response.content, response.header.code);
    return move(response.content);
}
//---------------------------------------------------------------------------
vector<Reservation> EC2::describeInstances(const string& region, const vector<Filter>& filters)
// Collect the reservations of all pages
{
    auto queries = describeInstancesQueries(filters);
    vector<Reservation> reservations;
    while (true) {
        auto content = execute(region, queries);
        for (auto& reservation : EC2Parser::parseReservations(content))
            reservations.push_back(move(reservation));
        auto token = EC2Parser::nextToken(content);
        if (token.empty())
            break;
        queries["NextToken"] = token;
    }
    return reservations;
}
//---------------------------------------------------------------------------
vector<Volume> EC2::describeVolumes(const string& region, const vector<string>& volumeIds)
// Collect the volumes of all pages
{
    auto queries = describeVolumesQueries(volumeIds);
    vector<Volume> volumes;
    while (true) {
        auto content = execute(region, queries);
        for (auto& volume : EC2Parser::parseVolumes(content))
            volumes.push_back(move(volume));
        auto token = EC2Parser::nextToken(content);
        if (token.empty())
            break;
        queries["NextToken"] = token;
    }
    return volumes;
}
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace ec2scout
