#pragma once
#include <cstdint>
#include <string_view>
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
/// This is the interface for connected byte streams (plain TCP or TLS)
class Stream {
    public:
    /// The destructor
    virtual ~Stream() noexcept = default;
    /// Send all data, throws on error or timeout
    virtual void send(std::string_view data) = 0;
    /// Receive up to length bytes, returns 0 on orderly shutdown, throws on error or timeout
    [[nodiscard]] virtual uint64_t recv(char* buffer, uint64_t length) = 0;
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
