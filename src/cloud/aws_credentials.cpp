#include "cloud/aws_credentials.hpp"
#include "utils/utils.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>
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
AWSCredentials::AWSCredentials(network::Transport& transport, const string& keyId, const string& key, const string& token) : AWSCredentials(transport)
// The static keys constructor
{
    Secret secret;
    secret.keyId = keyId;
    secret.secret = key;
    secret.token = token;
    _secret = move(secret);
    _settings.useInstanceMetadata = false;
}
//---------------------------------------------------------------------------
optional<AWSCredentials::Secret> AWSCredentials::fromEnvironment()
// Read the keys from the environment
{
    Secret secret;
    secret.keyId = utils::getEnvironment("AWS_ACCESS_KEY_ID");
    secret.secret = utils::getEnvironment("AWS_SECRET_ACCESS_KEY");
    if (secret.keyId.empty() || secret.secret.empty())
        return nullopt;
    secret.token = utils::getEnvironment("AWS_SESSION_TOKEN");
    return secret;
}
//---------------------------------------------------------------------------
bool AWSCredentials::validKeys(uint32_t offset) const
// Checks whether keys need to be refreshed
{
    if (!_secret || _secret->secret.empty())
        return false;
    if (_secret->expiration && _secret->expiration - offset < chrono::system_clock::to_time_t(chrono::system_clock::now()))
        return false;
    return true;
}
//---------------------------------------------------------------------------
const AWSCredentials::Secret& AWSCredentials::getSecret()
// Get the secret
{
    if (validKeys())
        return *_secret;
    if (!_secret || !_secret->expiration) {
        if (auto secret = fromEnvironment()) {
            _secret = move(secret);
            return *_secret;
        }
    }
    if (!_settings.useInstanceMetadata)
        throw runtime_error("No AWS credentials found");
    _secret = fromInstanceMetadata();
    return *_secret;
}
//---------------------------------------------------------------------------
network::Endpoint AWSCredentials::getIAMEndpoint() const
// The metadata endpoint
{
    return network::Endpoint{_settings.iamAddress, _settings.iamPort, false};
}
//---------------------------------------------------------------------------
network::HttpRequest AWSCredentials::tokenRequest() const
// Builds the IMDSv2 token request
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::PUT;
    request.path = "/latest/api/token";
    request.headers.emplace("Host", _settings.iamAddress);
    request.headers.emplace("X-aws-ec2-metadata-token-ttl-seconds", to_string(_settings.tokenTTL));
    request.headers.emplace("Content-Length", "0");
    return request;
}
//---------------------------------------------------------------------------
network::HttpRequest AWSCredentials::metadataRequest(const string& path, const string& token) const
// Builds the metadata request
{
    network::HttpRequest request;
    request.path = "/latest/meta-data/" + path;
    request.headers.emplace("Host", _settings.iamAddress);
    if (!token.empty())
        request.headers.emplace("X-aws-ec2-metadata-token", token);
    return request;
}
//---------------------------------------------------------------------------
string AWSCredentials::fetchToken()
// Get the IMDSv2 token
{
    try {
        auto response = _transport.execute(getIAMEndpoint(), tokenRequest());
        if (network::HttpResponse::checkSuccess(response.header.code))
            return response.content;
    } catch (const runtime_error& e) {
        cerr << "IMDSv2 token request failed, falling back to IMDSv1: " << e.what() << endl;
    }
    return "";
}
//---------------------------------------------------------------------------
string AWSCredentials::fetchMetadata(const string& path, const string& token)
// Get a metadata document
{
    auto response = _transport.execute(getIAMEndpoint(), metadataRequest(path, token));
    if (!network::HttpResponse::checkSuccess(response.header.code))
        throw runtime_error("Instance metadata request for " + path + " failed with status " + to_string(response.header.code));
    return response.content;
}
//---------------------------------------------------------------------------
AWSCredentials::Secret AWSCredentials::fromInstanceMetadata()
// Uses the metadata service to get the role credentials
{
    try {
        auto token = fetchToken();
        auto roles = fetchMetadata("iam/security-credentials/", token);
        auto iamUser = roles.substr(0, roles.find('\n'));
        if (iamUser.empty())
            throw runtime_error("no IAM role attached");
        auto content = fetchMetadata("iam/security-credentials/" + iamUser, token);
        Secret secret;
        if (!updateSecret(content, iamUser, secret))
            throw runtime_error("malformed role credentials");
        return secret;
    } catch (const runtime_error& e) {
        throw runtime_error(string("No AWS credentials found: ") + e.what());
    }
}
//---------------------------------------------------------------------------
bool AWSCredentials::updateSecret(string_view content, string_view iamUser, Secret& secret)
// Update secret
{
    auto document = nlohmann::json::parse(content, nullptr, false);
    if (document.is_discarded() || !document.is_object())
        return false;
    for (auto key : {"AccessKeyId", "SecretAccessKey", "Token", "Expiration"})
        if (!document.contains(key) || !document[key].is_string())
            return false;

    secret.keyId = document["AccessKeyId"].get<string>();
    secret.secret = document["SecretAccessKey"].get<string>();
    secret.token = document["Token"].get<string>();
    if (!utils::parseTimestamp(document["Expiration"].get<string>(), secret.expiration))
        return false;
    secret.iamUser = iamUser;
    return true;
}
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace ec2scout
