#include "cloud/aws_signer.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <map>
#include <sstream>
#include <stdexcept>
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
string AWSSigner::createCanonicalRequest(const network::HttpRequest& request, string& signedHeaders, const string& payloadHash)
// Creates the canonical request (task 1)
// https://docs.aws.amazon.com/general/latest/gr/sigv4-create-canonical-request.html
{
    stringstream requestStream;
    // Step 1, canonicalize request method
    requestStream << network::HttpRequest::getRequestMethod(request.method) << "\n";

    // Step 2, canonicalize request path; assume that path is RFC 3986 conform
    if (request.path.empty())
        requestStream << "/\n";
    else
        requestStream << request.path << "\n";

    // Step 3, canonicalize query, sorted by key and encoded
    requestStream << network::HttpRequest::encodeQueries(request.queries) << "\n";

    // Step 4, canonicalize headers, assume no unnecessary whitespaces in header
    map<string, string> sorted;
    for (const auto& h : request.headers) {
        string key = h.first;
        transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return tolower(c); });
        sorted.emplace(key, h.second);
    }
    for (const auto& h : sorted)
        requestStream << h.first << ":" << h.second << "\n";
    requestStream << "\n";

    // Step 5, create signed headers
    signedHeaders.clear();
    auto it = sorted.begin();
    while (it != sorted.end()) {
        signedHeaders += it->first;
        if (++it != sorted.end())
            signedHeaders += ";";
    }
    requestStream << signedHeaders << "\n";

    // Step 6, the hashed payload
    requestStream << payloadHash;
    return requestStream.str();
}
//---------------------------------------------------------------------------
void AWSSigner::encodeCanonicalRequest(network::HttpRequest& request, StringToSign& stringToSign)
// Hashes the canonical request
{
    stringToSign.payloadHash = utils::sha256Encode(request.body);
    auto requestString = createCanonicalRequest(request, stringToSign.signedHeaders, stringToSign.payloadHash);
    // Step 7, create sha256 request string
    stringToSign.requestSHA = utils::sha256Encode(requestString);
}
//---------------------------------------------------------------------------
string AWSSigner::createStringToSign(const StringToSign& stringToSign)
// Creates the string to sign (task 2)
// https://docs.aws.amazon.com/general/latest/gr/sigv4-create-string-to-sign.html
{
    auto it = stringToSign.request.headers.find("x-amz-date");
    if (it == stringToSign.request.headers.end())
        throw runtime_error("missing x-amz-date");

    stringstream requestStream;
    requestStream << "AWS4-HMAC-SHA256\n";
    requestStream << it->second << "\n";
    requestStream << it->second.substr(0, 8) << "/" << stringToSign.region << "/" << stringToSign.service << "/aws4_request\n";
    requestStream << stringToSign.requestSHA;
    return requestStream.str();
}
//---------------------------------------------------------------------------
string AWSSigner::createSignedRequest(const string& keyId, const string& secret, const StringToSign& stringToSign)
// Calculates the signature for AWS signature version 4 (task 3)
// https://docs.aws.amazon.com/general/latest/gr/sigv4-calculate-signature.html
{
    // Step 1, build derivedSigningKey
    auto it = stringToSign.request.headers.find("x-amz-date");
    if (it == stringToSign.request.headers.end())
        throw runtime_error("missing x-amz-date");

    string kRequest = "aws4_request";
    auto kSecret = "AWS4" + secret;
    auto date = it->second.substr(0, 8);
    auto sign = [](const pair<unique_ptr<uint8_t[]>, uint64_t>& key, const string& msg) {
        return utils::hmacSign(key.first.get(), key.second, reinterpret_cast<const uint8_t*>(msg.data()), msg.length());
    };
    auto derivedSigningKey = utils::hmacSign(reinterpret_cast<const uint8_t*>(kSecret.data()), kSecret.length(), reinterpret_cast<const uint8_t*>(date.data()), date.length());
    derivedSigningKey = sign(derivedSigningKey, stringToSign.region);
    derivedSigningKey = sign(derivedSigningKey, stringToSign.service);
    derivedSigningKey = sign(derivedSigningKey, kRequest);

    // Step 2, finally sign the stringToSign with the derivedSigningKey
    derivedSigningKey = sign(derivedSigningKey, createStringToSign(stringToSign));
    const auto signature = utils::hexEncode(derivedSigningKey.first.get(), derivedSigningKey.second);

    // https://docs.aws.amazon.com/general/latest/gr/sigv4-add-signature-to-request.html (task 4)
    stringstream authorization;
    authorization << "AWS4-HMAC-SHA256"
                  << " Credential=" << keyId << "/" << date << "/" << stringToSign.region << "/" << stringToSign.service << "/" << kRequest << ", SignedHeaders=" << stringToSign.signedHeaders << ", Signature=" << signature;

    stringToSign.request.headers.emplace("Authorization", authorization.str());
    return authorization.str();
}
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace ec2scout
