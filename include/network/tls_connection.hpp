#pragma once
#include "network/stream.hpp"
#include <string>
#include <openssl/types.h>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// Dominik Durner, 2023
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2scout {
namespace network {
//---------------------------------------------------------------------------
class TLSContext;
class TcpConnection;
//---------------------------------------------------------------------------
/// The TLS layer on top of a connected non-blocking TCP socket.
/// OpenSSL works directly on the fd; want read / want write is resolved by
/// polling the socket with the connection's io timeout.
class TLSConnection : public Stream {
    /// The SSL context
    TLSContext& _context;
    /// The underlying socket
    TcpConnection& _socket;
    /// The SSL connection
    SSL* _ssl;

    public:
    /// The constructor, performs the handshake and verifies the hostname
    TLSConnection(TLSContext& context, TcpConnection& socket, const std::string& hostname);
    /// The destructor
    ~TLSConnection() override;
    TLSConnection(const TLSConnection&) = delete;
    TLSConnection& operator=(const TLSConnection&) = delete;

    /// Send a TLS encrypted message
    void send(std::string_view data) override;
    /// Recv a TLS encrypted message
    [[nodiscard]] uint64_t recv(char* buffer, uint64_t length) override;

    private:
    /// Helper function that handles the SSL_op calls, returns the op result or 0 on a clean shutdown
    template <typename F>
    int operationHelper(F&& func, const char* operation);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
