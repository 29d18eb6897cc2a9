#include "utils/utils.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/sha.h>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace ec2scout {
namespace utils {
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char hex[] = "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (auto i = 0u; i < length; i++) {
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] >> 4])) : hex[input[i] >> 4]);
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] & 15])) : hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
string encodeUrlParameters(const string& encode)
// Encodes a string for url (RFC 3986 unreserved characters stay as they are)
{
    string result;
    for (auto c : encode) {
        if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~')
            result += c;
        else {
            result += "%";
            result += hexEncode(reinterpret_cast<uint8_t*>(&c), 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string sha256Encode(const uint8_t* data, uint64_t length)
// Encodes the data as sha256 hex string
{
    unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestUpdate(mdctx.get(), data, length) <= 0)
        throw runtime_error("OpenSSL Error!");

    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned digestLength = SHA256_DIGEST_LENGTH;
    if (EVP_DigestFinal_ex(mdctx.get(), hash, &digestLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    return hexEncode(hash, digestLength);
}
//---------------------------------------------------------------------------
pair<unique_ptr<uint8_t[]>, uint64_t> hmacSign(const uint8_t* keyData, uint64_t keyLength, const uint8_t* msgData, uint64_t msgLength)
// Encodes the msg with the key with hmac-sha256
{
    unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)> mac(EVP_MAC_fetch(nullptr, "HMAC", nullptr), EVP_MAC_free);
    if (!mac)
        throw runtime_error("OpenSSL Error!");

    OSSL_PARAM params[2];
    string digest = "SHA2-256";
    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest.data(), digest.size());
    params[1] = OSSL_PARAM_construct_end();

    unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)> mctx(EVP_MAC_CTX_new(mac.get()), EVP_MAC_CTX_free);
    if (!mctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_MAC_init(mctx.get(), keyData, keyLength, params) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_MAC_update(mctx.get(), msgData, msgLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    size_t len;
    if (EVP_MAC_final(mctx.get(), nullptr, &len, 0) <= 0)
        throw runtime_error("OpenSSL Error!");

    auto hash = make_unique<uint8_t[]>(len);
    if (EVP_MAC_final(mctx.get(), hash.get(), &len, len) <= 0)
        throw runtime_error("OpenSSL Error!");

    return {move(hash), len};
}
//---------------------------------------------------------------------------
bool parseTimestamp(string_view timestamp, int64_t& epochSeconds)
// Parses ISO 8601 timestamps as returned by AWS
{
    // Date and time part, AWS always sends at least seconds
    if (timestamp.size() < 19)
        return false;
    istringstream s(string(timestamp.substr(0, 19)));
    tm t{};
    s >> get_time(&t, "%Y-%m-%dT%H:%M:%S");
    if (s.fail())
        return false;
    auto rest = timestamp.substr(19);

    // Skip the fraction
    if (!rest.empty() && rest.front() == '.') {
        auto pos = rest.find_first_not_of("0123456789", 1);
        rest = pos == rest.npos ? string_view() : rest.substr(pos);
    }

    int64_t offset = 0;
    if (rest.empty() || rest == "Z") {
        offset = 0;
    } else if ((rest.front() == '+' || rest.front() == '-') && rest.size() == 6 && rest[3] == ':') {
        int hours = 0, minutes = 0;
        if (from_chars(rest.data() + 1, rest.data() + 3, hours).ec != errc() || from_chars(rest.data() + 4, rest.data() + 6, minutes).ec != errc())
            return false;
        offset = (hours * 60 + minutes) * 60;
        if (rest.front() == '-')
            offset = -offset;
    } else {
        return false;
    }

    epochSeconds = static_cast<int64_t>(timegm(&t)) - offset;
    return true;
}
//---------------------------------------------------------------------------
string formatTimestamp(int64_t epochSeconds)
// Formats the timestamp in UTC
{
    auto t = static_cast<time_t>(epochSeconds);
    tm utc{};
    gmtime_r(&t, &utc);
    stringstream s;
    s << put_time(&utc, "%Y-%m-%d %H:%M:%S") << "+00:00";
    return s.str();
}
//---------------------------------------------------------------------------
string normalizeTimestamp(string_view timestamp)
// Normalizes the timestamp to a stable textual form
{
    int64_t epochSeconds;
    if (!parseTimestamp(timestamp, epochSeconds))
        return string(timestamp);
    return formatTimestamp(epochSeconds);
}
//---------------------------------------------------------------------------
string getEnvironment(const char* name)
// Reads the environment variable
{
    auto value = getenv(name);
    return value ? string(value) : string();
}
//---------------------------------------------------------------------------
} // namespace utils
} // namespace ec2scout
