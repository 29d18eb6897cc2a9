#include "network/http_helper.hpp"
#include <charconv>
#include <stdexcept>
#include <string>
#include <string_view>
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
static constexpr string_view headerEnd = "\r\n\r\n";
//---------------------------------------------------------------------------
bool HttpHelper::headerComplete(string_view data)
// Is the header complete
{
    return data.find(headerEnd) != data.npos;
}
//---------------------------------------------------------------------------
HttpHelper::Info HttpHelper::detect(string_view header)
// Detect the protocol
{
    static constexpr string_view transferEncoding = "Transfer-Encoding";
    static constexpr string_view chunkedEncoding = "chunked";
    static constexpr string_view contentLength = "Content-Length";

    auto end = header.find(headerEnd);
    if (end == header.npos)
        throw runtime_error("Invalid HttpResponse: Incomplete header!");

    Info info;
    info.response = HttpResponse::deserialize(header.substr(0, end + headerEnd.size()));
    info.headerLength = static_cast<uint32_t>(end + headerEnd.size());

    if (HttpResponse::withoutContent(info.response.code)) {
        info.encoding = Encoding::NoContent;
    } else if (auto value = info.response.findHeader(transferEncoding); value && value->find(chunkedEncoding) != string::npos) {
        info.encoding = Encoding::ChunkedEncoding;
    } else if (auto value = info.response.findHeader(contentLength); value) {
        info.encoding = Encoding::ContentLength;
        auto [ptr, ec] = from_chars(value->data(), value->data() + value->size(), info.length);
        if (ec != errc() || ptr != value->data() + value->size())
            throw runtime_error("Invalid HttpResponse: Bad Content-Length!");
    } else {
        info.encoding = Encoding::ConnectionClose;
    }
    return info;
}
//---------------------------------------------------------------------------
bool HttpHelper::walkChunks(string_view body, string* content)
// Walks the chunked encoding
{
    static constexpr string_view strNewline = "\r\n";
    while (true) {
        auto lineEnd = body.find(strNewline);
        if (lineEnd == body.npos)
            return false;

        // Chunk size, extensions are ignored
        auto sizeString = body.substr(0, min(lineEnd, body.find(';')));
        uint64_t chunkSize = 0;
        auto [ptr, ec] = from_chars(sizeString.data(), sizeString.data() + sizeString.size(), chunkSize, 16);
        if (ec != errc())
            throw runtime_error("Invalid HttpResponse: Bad chunk size!");
        body = body.substr(lineEnd + strNewline.size());

        if (!chunkSize) {
            // Skip the trailer section up to the empty line
            while (true) {
                auto trailerEnd = body.find(strNewline);
                if (trailerEnd == body.npos)
                    return false;
                if (!trailerEnd)
                    return true;
                body = body.substr(trailerEnd + strNewline.size());
            }
        }

        if (chunkSize > body.size() || body.size() - chunkSize < strNewline.size())
            return false;
        if (content)
            content->append(body.substr(0, chunkSize));
        if (body.substr(chunkSize, strNewline.size()) != strNewline)
            throw runtime_error("Invalid HttpResponse: Chunk not terminated!");
        body = body.substr(chunkSize + strNewline.size());
    }
}
//---------------------------------------------------------------------------
bool HttpHelper::finished(string_view data, unique_ptr<Info>& info, bool closed)
// Detect end / content
{
    if (!info) {
        if (!headerComplete(data)) {
            if (closed)
                throw runtime_error("Connection closed before the header was complete");
            return false;
        }
        info = make_unique<Info>(detect(data));
    }
    auto body = data.substr(info->headerLength);
    switch (info->encoding) {
        case Encoding::NoContent:
            return true;
        case Encoding::ContentLength:
            if (body.size() >= info->length)
                return true;
            if (closed)
                throw runtime_error("Connection closed before the content was complete");
            return false;
        case Encoding::ChunkedEncoding:
            if (walkChunks(body, nullptr))
                return true;
            if (closed)
                throw runtime_error("Connection closed before the last chunk");
            return false;
        case Encoding::ConnectionClose:
            return closed;
        default:
            throw runtime_error("Unsupported HTTP transfer protocol");
    }
}
//---------------------------------------------------------------------------
string HttpHelper::retrieveContent(string_view data, unique_ptr<Info>& info)
// Retrieve the content without http meta info
{
    if (!info)
        info = make_unique<Info>(detect(data));
    auto body = data.substr(info->headerLength);
    switch (info->encoding) {
        case Encoding::NoContent:
            return {};
        case Encoding::ContentLength:
            if (body.size() < info->length)
                throw runtime_error("Invalid HttpResponse: Incomplete content!");
            return string(body.substr(0, info->length));
        case Encoding::ChunkedEncoding: {
            string content;
            if (!walkChunks(body, &content))
                throw runtime_error("Invalid HttpResponse: Incomplete chunked content!");
            info->length = content.size();
            return content;
        }
        case Encoding::ConnectionClose:
            return string(body);
        default:
            throw runtime_error("Unsupported HTTP transfer protocol");
    }
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
