#include "network/tls_connection.hpp"
#include "network/tcp_connection.hpp"
#include "network/tls_context.hpp"
#include <algorithm>
#include <climits>
#include <stdexcept>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <poll.h>
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
using namespace std;
//---------------------------------------------------------------------------
TLSConnection::TLSConnection(TLSContext& context, TcpConnection& socket, const string& hostname) : _context(context), _socket(socket), _ssl(nullptr)
// The constructor
{
    _ssl = SSL_new(_context._ctx);
    if (!_ssl)
        throw runtime_error(string("TLS init error: ") + TLSContext::lastError());

    // SNI and hostname verification
    if (!SSL_set_fd(_ssl, _socket.fd()) || !SSL_set_tlsext_host_name(_ssl, hostname.c_str()) || !SSL_set1_host(_ssl, hostname.c_str())) {
        SSL_free(_ssl);
        throw runtime_error(string("TLS init error: ") + TLSContext::lastError());
    }
    SSL_set_connect_state(_ssl);

    auto ssl = _ssl;
    try {
        operationHelper([ssl]() { return SSL_connect(ssl); }, "connect");
    } catch (const runtime_error&) {
        SSL_free(_ssl);
        throw;
    }
}
//---------------------------------------------------------------------------
TLSConnection::~TLSConnection()
// The destructor
{
    // Best effort close notify, the socket is closed afterwards anyway
    SSL_shutdown(_ssl);
    SSL_free(_ssl);
}
//---------------------------------------------------------------------------
template <typename F>
int TLSConnection::operationHelper(F&& func, const char* operation)
// Helper function that handles the SSL_op calls
{
    while (true) {
        ERR_clear_error();
        auto status = func();
        auto error = SSL_get_error(_ssl, status);
        switch (error) {
            case SSL_ERROR_NONE:
                return status;
            case SSL_ERROR_ZERO_RETURN:
                return 0;
            case SSL_ERROR_WANT_READ:
                _socket.wait(POLLIN);
                break;
            case SSL_ERROR_WANT_WRITE:
                _socket.wait(POLLOUT);
                break;
            default: {
                string message = "TLS ";
                message += operation;
                message += " error: ";
                if (SSL_get_verify_result(_ssl) != X509_V_OK)
                    message += X509_verify_cert_error_string(SSL_get_verify_result(_ssl));
                else
                    message += TLSContext::lastError();
                throw runtime_error(message);
            }
        }
    }
}
//---------------------------------------------------------------------------
void TLSConnection::send(string_view data)
// Send a TLS encrypted message
{
    while (!data.empty()) {
        auto ssl = _ssl;
        auto length = static_cast<int>(min<size_t>(data.size(), INT_MAX));
        auto buffer = data.data();
        auto written = operationHelper([ssl, buffer, length]() { return SSL_write(ssl, buffer, length); }, "send");
        if (written <= 0)
            throw runtime_error("TLS send error: connection closed");
        data.remove_prefix(static_cast<size_t>(written));
    }
}
//---------------------------------------------------------------------------
uint64_t TLSConnection::recv(char* buffer, uint64_t length)
// Recv a TLS encrypted message
{
    auto ssl = _ssl;
    auto bufferLength = static_cast<int>(min<uint64_t>(length, INT_MAX));
    auto read = operationHelper([ssl, buffer, bufferLength]() { return SSL_read(ssl, buffer, bufferLength); }, "recv");
    return static_cast<uint64_t>(read);
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
