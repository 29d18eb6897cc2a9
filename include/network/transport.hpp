#pragma once
#include "network/http_request.hpp"
#include "network/http_response.hpp"
#include <cstdint>
#include <string>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// EC2Scout Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2scout {
namespace network {
//---------------------------------------------------------------------------
/// The remote endpoint
struct Endpoint {
    /// The host name
    std::string host;
    /// The port
    uint32_t port = 443;
    /// Use TLS
    bool https = true;
};
//---------------------------------------------------------------------------
/// The interface for exchanging a single http request with a remote endpoint
class Transport {
    public:
    /// The received response
    struct Response {
        /// The header
        HttpResponse header;
        /// The decoded content
        std::string content;
    };

    /// The destructor
    virtual ~Transport() noexcept = default;
    /// Send the request and wait for the full response, throws on transport errors
    [[nodiscard]] virtual Response execute(const Endpoint& endpoint, const HttpRequest& request) = 0;
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
