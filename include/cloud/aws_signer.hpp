#pragma once
#include "network/http_request.hpp"
#include <string>
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
/// Implements the AWS Signature Version 4 logic for query APIs
/// It follows the v4 docu: https://docs.aws.amazon.com/general/latest/gr/sigv4_signing.html
class AWSSigner {
    public:
    struct StringToSign {
        /// The canonical request
        network::HttpRequest& request;
        /// The region
        std::string region;
        /// The service
        std::string service;
        /// The request sha
        std::string requestSHA;
        /// The signed headers
        std::string signedHeaders;
        /// The payload hash
        std::string payloadHash;
    };

    /// Creates the canonical request from the input, the payload is the request body
    static void encodeCanonicalRequest(network::HttpRequest& request, StringToSign& stringToSign);
    /// Calculates the signature and adds the Authorization header, returns the header value
    static std::string createSignedRequest(const std::string& keyId, const std::string& secret, const StringToSign& stringToSign);
    /// Creates the canonical request string (task 1)
    [[nodiscard]] static std::string createCanonicalRequest(const network::HttpRequest& request, std::string& signedHeaders, const std::string& payloadHash);

    private:
    /// Creates the string to sign
    [[nodiscard]] static std::string createStringToSign(const StringToSign& stringToSign);
};
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace ec2scout
