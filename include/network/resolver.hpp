#pragma once
#include <memory>
#include <string>
#include <netdb.h>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2scout {
namespace network {
//---------------------------------------------------------------------------
/// The addr resolver and cacher, which is not thread safe.
/// Keeps the last resolved address, paginated requests hit the same endpoint.
class Resolver {
    protected:
    /// The addr info
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> _addr;
    /// The current addr string
    std::string _addrString;

    public:
    /// The constructor
    Resolver() : _addr(nullptr, &freeaddrinfo) {}
    /// The address resolving, the result stays valid until the next call
    const addrinfo* resolve(const std::string& hostname, const std::string& port);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
