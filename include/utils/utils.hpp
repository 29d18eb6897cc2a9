#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2scout {
namespace utils {
//---------------------------------------------------------------------------
/// Encode url special characters in %HEX
std::string encodeUrlParameters(const std::string& encode);
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Build sha256 of the data encoded as hex
std::string sha256Encode(const uint8_t* data, uint64_t length);
/// Build sha256 of the string encoded as hex
inline std::string sha256Encode(std::string_view data) { return sha256Encode(reinterpret_cast<const uint8_t*>(data.data()), data.size()); }
/// Sign with hmac and return sha256 encoded signature
std::pair<std::unique_ptr<uint8_t[]>, uint64_t> hmacSign(const uint8_t* keyData, uint64_t keyLength, const uint8_t* msgData, uint64_t msgLength);
/// Parse an ISO 8601 timestamp (2024-01-15T10:30:00.000Z, offsets allowed) into unix seconds
[[nodiscard]] bool parseTimestamp(std::string_view timestamp, int64_t& epochSeconds);
/// Formats unix seconds as "YYYY-MM-DD HH:MM:SS+00:00"
[[nodiscard]] std::string formatTimestamp(int64_t epochSeconds);
/// Normalizes an ISO 8601 timestamp to "YYYY-MM-DD HH:MM:SS+00:00", unparsable input is returned unchanged
[[nodiscard]] std::string normalizeTimestamp(std::string_view timestamp);
/// Get an environment variable, empty if unset
[[nodiscard]] std::string getEnvironment(const char* name);
//---------------------------------------------------------------------------
} // namespace utils
} // namespace ec2scout
