#include "network/tcp_connection.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
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
using namespace std;
//---------------------------------------------------------------------------
static int pollFor(int fd, short events, chrono::milliseconds timeout)
// Poll a single fd, returns the revents, 0 on timeout, -errno on error
{
    pollfd pfd = {fd, events, 0};
    auto deadline = chrono::steady_clock::now() + timeout;
    while (true) {
        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
        if (remaining.count() < 0)
            return 0;
        auto ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready > 0)
            return pfd.revents;
        if (ready == 0)
            return 0;
        if (errno != EINTR)
            return -errno;
    }
}
//---------------------------------------------------------------------------
TcpConnection::TcpConnection(const addrinfo* addresses, Timeouts timeouts) : _fd(-1), _timeouts(timeouts)
// Connect to the first address that accepts the connection
{
    int lastError = EHOSTUNREACH;
    for (auto address = addresses; address; address = address->ai_next) {
        auto fd = connectTo(*address);
        if (fd >= 0) {
            _fd = fd;
            return;
        }
        lastError = -fd;
    }
    throw runtime_error(string("Socket connect error: ") + strerror(lastError));
}
//---------------------------------------------------------------------------
TcpConnection::~TcpConnection() noexcept
// The destructor
{
    if (_fd >= 0)
        ::close(_fd);
}
//---------------------------------------------------------------------------
int TcpConnection::connectTo(const addrinfo& address) const
// Non-blocking connect with timeout
{
    auto fd = ::socket(address.ai_family, address.ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, address.ai_protocol);
    if (fd < 0)
        return -errno;

    if (::connect(fd, address.ai_addr, address.ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            auto err = errno;
            ::close(fd);
            return -err;
        }
        auto revents = pollFor(fd, POLLOUT, _timeouts.connect);
        if (revents <= 0) {
            ::close(fd);
            return revents == 0 ? -ETIMEDOUT : revents;
        }
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0)
            err = errno;
        if (err) {
            ::close(fd);
            return -err;
        }
    }
    return fd;
}
//---------------------------------------------------------------------------
void TcpConnection::wait(short events) const
// Wait for the socket
{
    auto revents = pollFor(_fd, events, _timeouts.io);
    if (revents == 0)
        throw runtime_error("Socket timeout!");
    if (revents < 0)
        throw runtime_error(string("Socket poll error: ") + strerror(-revents));
    if ((revents & POLLNVAL) || ((revents & (POLLERR | POLLHUP)) && !(revents & events))) {
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(_fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0 || !err)
            err = EIO;
        throw runtime_error(string("Socket error: ") + strerror(err));
    }
}
//---------------------------------------------------------------------------
void TcpConnection::send(string_view data)
// Send all data
{
    while (!data.empty()) {
        auto sent = ::send(_fd, data.data(), data.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                wait(POLLOUT);
                continue;
            }
            if (errno == EINTR)
                continue;
            throw runtime_error(string("Socket send error: ") + strerror(errno));
        }
        data.remove_prefix(static_cast<size_t>(sent));
    }
}
//---------------------------------------------------------------------------
uint64_t TcpConnection::recv(char* buffer, uint64_t length)
// Receive data
{
    while (true) {
        auto received = ::recv(_fd, buffer, length, MSG_DONTWAIT);
        if (received >= 0)
            return static_cast<uint64_t>(received);
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            wait(POLLIN);
            continue;
        }
        if (errno != EINTR)
            throw runtime_error(string("Socket recv error: ") + strerror(errno));
    }
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
