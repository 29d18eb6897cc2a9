#pragma once
#include "network/stream.hpp"
#include <chrono>
#include <cstdint>
#include <string_view>
#include <netdb.h>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2scout {
namespace network {
//---------------------------------------------------------------------------
/// This class opens a non-blocking TCP connection to a server and exchanges
/// messages with the poll interface, every wait is bounded by a timeout.
class TcpConnection : public Stream {
    public:
    /// The timeouts
    struct Timeouts {
        /// The connect timeout
        std::chrono::milliseconds connect = std::chrono::seconds(10);
        /// The timeout for each send or recv step
        std::chrono::milliseconds io = std::chrono::seconds(30);
    };

    private:
    /// The file descriptor
    int _fd;
    /// The timeouts
    Timeouts _timeouts;

    public:
    /// Connects to the first reachable address
    TcpConnection(const addrinfo* addresses, Timeouts timeouts);
    /// The destructor closes the socket
    ~TcpConnection() noexcept override;
    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    /// Get the file descriptor
    [[nodiscard]] int fd() const { return _fd; }
    /// Wait until the socket is ready for the events, throws on timeout
    void wait(short events) const;

    /// Send all data
    void send(std::string_view data) override;
    /// Receive up to length bytes
    [[nodiscard]] uint64_t recv(char* buffer, uint64_t length) override;

    private:
    /// Try to connect to a single address, returns the fd or -errno
    int connectTo(const addrinfo& address) const;
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
