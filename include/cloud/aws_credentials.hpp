#pragma once
#include "network/http_request.hpp"
#include "network/transport.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
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
namespace test {
class AWSCredentialsTester;
}; // namespace test
//---------------------------------------------------------------------------
/// Discovers the AWS credentials, first from the environment and then from the instance metadata service
class AWSCredentials {
    public:
    /// The secret
    struct Secret {
        /// The IAM role
        std::string iamUser;
        /// The key id
        std::string keyId;
        /// The secret
        std::string secret;
        /// The session token
        std::string token;
        /// The expiration, 0 for static keys
        int64_t expiration = 0;
    };

    /// The settings of the metadata service
    struct Settings {
        /// The IMDS address
        std::string iamAddress = "169.254.169.254";
        /// The IMDS port
        uint32_t iamPort = 80;
        /// The lifetime of an IMDSv2 token in seconds
        uint32_t tokenTTL = 21600;
        /// Query the metadata service if the environment has no keys
        bool useInstanceMetadata = true;
    };

    private:
    /// The transport for the metadata service
    network::Transport& _transport;
    /// The settings
    Settings _settings;
    /// The cached secret
    std::optional<Secret> _secret;

    public:
    /// The constructor
    explicit AWSCredentials(network::Transport& transport) : AWSCredentials(transport, Settings()) {}
    /// The constructor with custom metadata settings
    AWSCredentials(network::Transport& transport, Settings settings) : _transport(transport), _settings(std::move(settings)) {}
    /// The static keys constructor
    AWSCredentials(network::Transport& transport, const std::string& keyId, const std::string& key, const std::string& token = "");

    /// Get a valid secret, throws if none can be found
    [[nodiscard]] const Secret& getSecret();
    /// Read the keys from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and AWS_SESSION_TOKEN
    [[nodiscard]] static std::optional<Secret> fromEnvironment();

    private:
    /// Query the metadata service
    [[nodiscard]] Secret fromInstanceMetadata();
    /// Checks whether the cached keys are still valid
    [[nodiscard]] bool validKeys(uint32_t offset = 60) const;
    /// Get the IMDSv2 token, empty if the service only speaks IMDSv1
    [[nodiscard]] std::string fetchToken();
    /// Get a metadata document
    [[nodiscard]] std::string fetchMetadata(const std::string& path, const std::string& token);
    /// Builds the IMDSv2 token request
    [[nodiscard]] network::HttpRequest tokenRequest() const;
    /// Builds a metadata request
    [[nodiscard]] network::HttpRequest metadataRequest(const std::string& path, const std::string& token) const;
    /// Get the metadata endpoint
    [[nodiscard]] network::Endpoint getIAMEndpoint() const;
    /// Parse the role credentials document
    [[nodiscard]] static bool updateSecret(std::string_view content, std::string_view iamUser, Secret& secret);

    friend test::AWSCredentialsTester;
};
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace ec2scout
