#include "network/http_response.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>
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
const string* HttpResponse::findHeader(string_view name) const
// Case-insensitive header lookup
{
    auto equal = [](char a, char b) { return tolower(static_cast<unsigned char>(a)) == tolower(static_cast<unsigned char>(b)); };
    for (auto& keyValue : headers)
        if (keyValue.first.size() == name.size() && std::equal(keyValue.first.begin(), keyValue.first.end(), name.begin(), name.end(), equal))
            return &keyValue.second;
    return nullptr;
}
//---------------------------------------------------------------------------
HttpResponse HttpResponse::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr string_view strHeaderSeperator = ":";

    HttpResponse response;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpResponse: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw runtime_error("Invalid HttpResponse: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // the http type
            if (line.starts_with(strHttp1_0)) {
                response.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                response.type = Type::HTTP_1_1;
            } else {
                throw runtime_error("Invalid HttpResponse: Needs to be a HTTP type 1.0 or 1.1!");
            }

            // the status code and the reason phrase
            string_view httpType = getResponseType(response.type);
            line = line.substr(httpType.size());
            if (line.size() < 4 || line.front() != ' ')
                throw runtime_error("Invalid HttpResponse: Missing status code!");
            auto [ptr, ec] = from_chars(line.data() + 1, line.data() + 4, response.code);
            if (ec != errc() || ptr != line.data() + 4)
                throw runtime_error("Invalid HttpResponse: Invalid status code!");
            if (line.size() > 5)
                response.reason = line.substr(5);
        } else {
            // headers, optional whitespace around the value
            auto keyPos = line.find(strHeaderSeperator);
            if (keyPos == line.npos)
                throw runtime_error("Invalid HttpResponse: Headers need key and value!");
            auto key = line.substr(0, keyPos);
            auto value = line.substr(keyPos + strHeaderSeperator.size());
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
                value.remove_prefix(1);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
                value.remove_suffix(1);
            response.headers.emplace(key, value);
        }
    }

    return response;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
