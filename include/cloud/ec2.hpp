#pragma once
#include "cloud/aws_credentials.hpp"
#include "cloud/ec2_api.hpp"
#include "network/http_request.hpp"
#include "network/transport.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
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
class EC2Tester;
}; // namespace test
//---------------------------------------------------------------------------
/// Implements the EC2 query API logic
class EC2 : public EC2Api {
    public:
    /// The settings for EC2 requests
    struct Settings {
        /// The custom endpoint, ec2.<region>.amazonaws.com if empty
        std::string endpoint;
        /// The port
        uint32_t port = 443;
        /// Use TLS
        bool https = true;
    };

    /// The API version
    static constexpr const char* apiVersion = "2016-11-15";
    /// The fake AMZ timestamp
    const char* fakeAMZTimestamp = "21000101T000000Z";
    /// Use the fake timestamp for reproducible signatures
    static bool testEnvironment;

    private:
    /// The transport
    network::Transport& _transport;
    /// The credentials
    AWSCredentials& _credentials;
    /// The settings
    Settings _settings;

    public:
    /// The constructor
    EC2(network::Transport& transport, AWSCredentials& credentials) : EC2(transport, credentials, Settings()) {}
    /// The constructor with custom endpoint settings
    EC2(network::Transport& transport, AWSCredentials& credentials, Settings settings) : _transport(transport), _credentials(credentials), _settings(std::move(settings)) {}

    /// Get the reservations matching all filters, follows nextToken
    [[nodiscard]] std::vector<Reservation> describeInstances(const std::string& region, const std::vector<Filter>& filters) override;
    /// Get the volumes with the ids, follows nextToken
    [[nodiscard]] std::vector<Volume> describeVolumes(const std::string& region, const std::vector<std::string>& volumeIds) override;

    /// Get the endpoint of the region
    [[nodiscard]] network::Endpoint getEndpoint(const std::string& region) const;

    private:
    /// Get the host header value
    [[nodiscard]] std::string getAddress(const std::string& region) const;
    /// Creates the http request and signs it
    [[nodiscard]] network::HttpRequest buildRequest(const std::string& region, std::map<std::string, std::string> queries) const;
    /// Sends the request and returns the body, throws EC2Error for error responses
    [[nodiscard]] std::string execute(const std::string& region, const std::map<std::string, std::string>& queries);
    /// The DescribeInstances query parameters
    [[nodiscard]] static std::map<std::string, std::string> describeInstancesQueries(const std::vector<Filter>& filters);
    /// The DescribeVolumes query parameters
    [[nodiscard]] static std::map<std::string, std::string> describeVolumesQueries(const std::vector<std::string>& volumeIds);

    friend test::EC2Tester;
};
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace ec2scout
