#pragma once
#include <openssl/ssl.h>
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
class TLSConnection;
//---------------------------------------------------------------------------
/// The client side TLS context, peers are verified against the system trust store
class TLSContext {
    /// The ssl context
    SSL_CTX* _ctx;

    public:
    /// The constructor
    TLSContext();
    /// The destructor
    ~TLSContext();
    TLSContext(const TLSContext&) = delete;
    TLSContext& operator=(const TLSContext&) = delete;

    /// Init the OpenSSL algos and errors
    static void initOpenSSL();
    /// The last OpenSSL error as text
    [[nodiscard]] static const char* lastError();

    friend TLSConnection;
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
