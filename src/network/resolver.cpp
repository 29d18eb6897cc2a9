#include "network/resolver.hpp"
#include <cstring>
#include <stdexcept>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// Dominik Durner, 2021
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
const addrinfo* Resolver::resolve(const string& hostname, const string& port)
// Resolve the request
{
    auto hostString = hostname + ":" + port;
    if (_addr && _addrString == hostString)
        return _addr.get();

    addrinfo hints = {};
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* temp;
    if (auto error = getaddrinfo(hostname.c_str(), port.c_str(), &hints, &temp); error != 0)
        throw runtime_error("hostname getaddrinfo error for " + hostname + ": " + gai_strerror(error));
    _addr.reset(temp);
    _addrString = move(hostString);
    return _addr.get();
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
