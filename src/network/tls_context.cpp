#include "network/tls_context.hpp"
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
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
TLSContext::TLSContext()
// Construct the TLS Context
{
    initOpenSSL();

    // Set up the context
    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx)
        throw runtime_error(string("OpenSSL context error: ") + lastError());

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION) || !SSL_CTX_set_default_verify_paths(_ctx)) {
        SSL_CTX_free(_ctx);
        throw runtime_error(string("OpenSSL context error: ") + lastError());
    }
    SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
}
//---------------------------------------------------------------------------
TLSContext::~TLSContext()
// The destructor
{
    SSL_CTX_free(_ctx);
}
//---------------------------------------------------------------------------
void TLSContext::initOpenSSL()
// Inits the openssl algos
{
    if (!OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr))
        throw runtime_error("OpenSSL init error");
}
//---------------------------------------------------------------------------
const char* TLSContext::lastError()
// The last error of the thread's queue
{
    auto error = ERR_get_error();
    if (!error)
        return "unknown error";
    auto reason = ERR_reason_error_string(error);
    return reason ? reason : "unknown error";
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
