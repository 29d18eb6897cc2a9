#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <cstdlib>
#include <string>
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
namespace test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("utils_crypto") {
    REQUIRE(sha256Encode("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256Encode("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    // RFC 4231 test case 2
    string key = "Jefe";
    string msg = "what do ya want for nothing?";
    auto mac = hmacSign(reinterpret_cast<const uint8_t*>(key.data()), key.size(), reinterpret_cast<const uint8_t*>(msg.data()), msg.size());
    REQUIRE(mac.second == 32);
    REQUIRE(hexEncode(mac.first.get(), mac.second) == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

    const uint8_t bytes[] = {0x00, 0xab, 0xff};
    REQUIRE(hexEncode(bytes, 3) == "00abff");
    REQUIRE(hexEncode(bytes, 3, true) == "00ABFF");
}
//---------------------------------------------------------------------------
TEST_CASE("utils_url_encoding") {
    REQUIRE(encodeUrlParameters("web-01_a.b~c") == "web-01_a.b~c");
    REQUIRE(encodeUrlParameters("tag:Name") == "tag%3AName");
    REQUIRE(encodeUrlParameters("a b/c+d=") == "a%20b%2Fc%2Bd%3D");
    REQUIRE(encodeUrlParameters("\xc3\xa4") == "%C3%A4");
}
//---------------------------------------------------------------------------
TEST_CASE("utils_timestamp") {
    int64_t epoch = 0;
    REQUIRE(parseTimestamp("2024-01-15T10:30:00Z", epoch));
    REQUIRE(epoch == 1705314600);
    REQUIRE(parseTimestamp("2024-01-15T10:30:00.000Z", epoch));
    REQUIRE(epoch == 1705314600);
    REQUIRE(parseTimestamp("2024-01-15T20:30:00+10:00", epoch));
    REQUIRE(epoch == 1705314600);
    REQUIRE(parseTimestamp("2024-01-15T08:00:00-02:30", epoch));
    REQUIRE(epoch == 1705314600);
    REQUIRE(!parseTimestamp("yesterday", epoch));
    REQUIRE(!parseTimestamp("2024-01-15T10:30:00 UTC", epoch));

    REQUIRE(formatTimestamp(0) == "1970-01-01 00:00:00+00:00");
    REQUIRE(normalizeTimestamp("2024-01-15T10:30:00.000Z") == "2024-01-15 10:30:00+00:00");
    REQUIRE(normalizeTimestamp("2024-01-15 10:30:00+00:00") == "2024-01-15 10:30:00+00:00");
    REQUIRE(normalizeTimestamp("unknown") == "unknown");
}
//---------------------------------------------------------------------------
TEST_CASE("utils_environment") {
    REQUIRE(setenv("EC2SCOUT_TEST_VARIABLE", "value", 1) == 0);
    REQUIRE(getEnvironment("EC2SCOUT_TEST_VARIABLE") == "value");
    REQUIRE(unsetenv("EC2SCOUT_TEST_VARIABLE") == 0);
    REQUIRE(getEnvironment("EC2SCOUT_TEST_VARIABLE").empty());
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace utils
} // namespace ec2scout
