#include "network/http_request.hpp"
#include "utils/utils.hpp"
#include <map>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// Dominik Durner, 2024
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
string HttpRequest::encodeQueries(const map<string, string>& queries)
// The canonical query string
{
    string result;
    auto it = queries.begin();
    while (it != queries.end()) {
        result += utils::encodeUrlParameters(it->first) + "=" + utils::encodeUrlParameters(it->second);
        if (++it != queries.end())
            result += "&";
    }
    return result;
}
//---------------------------------------------------------------------------
string HttpRequest::serialize(const HttpRequest& request)
// Serialize an http request
{
    string httpHeader = getRequestMethod(request.method);
    httpHeader += " " + (request.path.empty() ? string("/") : request.path);
    if (request.queries.size())
        httpHeader += "?" + encodeQueries(request.queries);
    httpHeader += " ";
    httpHeader += getRequestType(request.type);
    httpHeader += "\r\n";
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    httpHeader += request.body;
    return httpHeader;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
