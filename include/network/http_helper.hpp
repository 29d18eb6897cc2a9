#pragma once
#include "network/http_response.hpp"
#include <cstdint>
#include <memory>
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
/// Implements an helper to resolve http responses
class HttpHelper {
    public:
    /// The encoding
    enum class Encoding : uint8_t {
        Unknown,
        ContentLength,
        ChunkedEncoding,
        ConnectionClose,
        NoContent
    };

    struct Info {
        /// The response header
        HttpResponse response;
        /// The content length (decoded length for chunked encoding once finished)
        uint64_t length = 0;
        /// The header length
        uint32_t headerLength = 0;
        /// The encoding
        Encoding encoding = Encoding::Unknown;
    };

    private:
    /// Detect the protocol
    [[nodiscard]] static Info detect(std::string_view header);
    /// Walk the chunks, appends the payload to content if given, true if the last chunk was seen
    [[nodiscard]] static bool walkChunks(std::string_view body, std::string* content);

    public:
    /// Is the header fully received
    [[nodiscard]] static bool headerComplete(std::string_view data);
    /// Detect end / content, the info is created once the header is complete
    [[nodiscard]] static bool finished(std::string_view data, std::unique_ptr<Info>& info, bool closed = false);
    /// Retrieve the content without http meta info, chunks are decoded
    [[nodiscard]] static std::string retrieveContent(std::string_view data, std::unique_ptr<Info>& info);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
