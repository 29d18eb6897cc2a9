#pragma once
#include "network/resolver.hpp"
#include "network/tcp_connection.hpp"
#include "network/transport.hpp"
#include <memory>
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
class TLSContext;
//---------------------------------------------------------------------------
/// Blocking http(s) client, one connection per request (Connection: close)
class HttpClient : public Transport {
    /// The resolver
    Resolver _resolver;
    /// The TLS context, created on the first https request
    std::unique_ptr<TLSContext> _tlsContext;
    /// The timeouts
    TcpConnection::Timeouts _timeouts;
    /// The receive chunk size
    static constexpr uint64_t chunkSize = 64u * 1024;

    public:
    /// The constructor
    explicit HttpClient(TcpConnection::Timeouts timeouts = {});
    /// The destructor
    ~HttpClient() noexcept override;

    /// Send the request and wait for the full response
    [[nodiscard]] Response execute(const Endpoint& endpoint, const HttpRequest& request) override;
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
