#include "utils/xml_reader.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// EC2Scout Authors, 2026
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
TEST_CASE("xml_reader_nesting") {
    string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                 "<Root xmlns=\"http://ec2.amazonaws.com/doc/2016-11-15/\">\n"
                 "  <!-- <item>ignored</item> -->\n"
                 "  <requestId>abc</requestId>\n"
                 "  <set>\n"
                 "    <item><id>1</id><set><item><id>inner</id></item></set></item>\n"
                 "    <item><id>2</id><empty/></item>\n"
                 "  </set>\n"
                 "  <id>outer</id>\n"
                 "</Root>";

    auto roots = XmlReader::elements(xml);
    REQUIRE(roots.size() == 1);
    REQUIRE(roots[0].name == "Root");

    auto root = roots[0].content;
    REQUIRE(XmlReader::text(root, "requestId") == "abc");
    // Only direct children are matched
    REQUIRE(XmlReader::text(root, "id") == "outer");

    auto items = XmlReader::items(root, "set");
    REQUIRE(items.size() == 2);
    REQUIRE(XmlReader::text(items[0], "id") == "1");
    REQUIRE(XmlReader::items(items[0], "set").size() == 1);
    REQUIRE(XmlReader::text(XmlReader::items(items[0], "set")[0], "id") == "inner");
    REQUIRE(XmlReader::text(items[1], "id") == "2");

    // Self-closing and missing elements
    REQUIRE(XmlReader::child(items[1], "empty").has_value());
    REQUIRE(XmlReader::child(items[1], "empty")->empty());
    REQUIRE(!XmlReader::optionalText(items[1], "empty"));
    REQUIRE(!XmlReader::child(items[1], "missing"));
    REQUIRE(XmlReader::text(items[1], "missing", "N/A") == "N/A");
    REQUIRE(XmlReader::items(items[1], "missing").empty());
}
//---------------------------------------------------------------------------
TEST_CASE("xml_reader_decode") {
    REQUIRE(XmlReader::decode("a &lt;b&gt; &amp; &quot;c&quot; &apos;d&apos;") == "a <b> & \"c\" 'd'");
    REQUIRE(XmlReader::decode("&#65;&#x42;&#xe4;") == "AB\xc3\xa4");
    REQUIRE(XmlReader::decode("<![CDATA[<raw> & text]]>") == "<raw> & text");
    REQUIRE_THROWS_AS(XmlReader::decode("&unknown;"), runtime_error);
    REQUIRE_THROWS_AS(XmlReader::decode("&amp"), runtime_error);

    string xml = "<tag><value>web &amp; db</value><cdata><![CDATA[</value>]]></cdata></tag>";
    auto tag = XmlReader::elements(xml)[0].content;
    REQUIRE(XmlReader::text(tag, "value") == "web & db");
    REQUIRE(XmlReader::text(tag, "cdata") == "</value>");
}
//---------------------------------------------------------------------------
TEST_CASE("xml_reader_malformed") {
    REQUIRE_THROWS_AS(XmlReader::elements("<a><b></a>"), runtime_error);
    REQUIRE_THROWS_AS(XmlReader::elements("<a>"), runtime_error);
    REQUIRE_THROWS_AS(XmlReader::elements("</a>"), runtime_error);
    REQUIRE_THROWS_AS(XmlReader::elements("<a"), runtime_error);
    REQUIRE(XmlReader::elements("plain text").empty());
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace utils
} // namespace ec2scout
