#include "utils/xml_reader.hpp"
#include <charconv>
#include <stdexcept>
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
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static void appendUtf8(string& out, uint32_t codePoint)
// Appends the code point as utf-8
{
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}
//---------------------------------------------------------------------------
vector<XmlReader::Element> XmlReader::elements(string_view content)
// Scan the direct children
{
    static constexpr string_view strComment = "<!--";
    static constexpr string_view strCommentEnd = "-->";
    static constexpr string_view strCData = "<![CDATA[";
    static constexpr string_view strCDataEnd = "]]>";

    vector<Element> result;
    unsigned depth = 0;
    string_view currentName;
    size_t contentStart = 0;
    size_t pos = 0;
    while ((pos = content.find('<', pos)) != content.npos) {
        auto rest = content.substr(pos);
        if (rest.starts_with(strComment)) {
            auto end = content.find(strCommentEnd, pos + strComment.size());
            if (end == content.npos)
                throw runtime_error("Invalid XML: Unterminated comment!");
            pos = end + strCommentEnd.size();
            continue;
        }
        if (rest.starts_with(strCData)) {
            auto end = content.find(strCDataEnd, pos + strCData.size());
            if (end == content.npos)
                throw runtime_error("Invalid XML: Unterminated CDATA section!");
            pos = end + strCDataEnd.size();
            continue;
        }

        auto end = content.find('>', pos);
        if (end == content.npos)
            throw runtime_error("Invalid XML: Unterminated tag!");
        auto tag = content.substr(pos + 1, end - pos - 1);
        pos = end + 1;

        // Declarations and processing instructions
        if (tag.starts_with('?') || tag.starts_with('!'))
            continue;

        if (tag.starts_with('/')) {
            if (!depth)
                throw runtime_error("Invalid XML: Unbalanced closing tag!");
            if (--depth == 0) {
                auto name = tag.substr(1);
                name = name.substr(0, name.find_first_of(" \t\r\n"));
                if (name != currentName)
                    throw runtime_error("Invalid XML: Mismatched closing tag!");
                result.push_back({currentName, content.substr(contentStart, end - tag.size() - 1 - contentStart)});
            }
            continue;
        }

        auto selfClosing = tag.ends_with('/');
        if (selfClosing)
            tag.remove_suffix(1);
        auto name = tag.substr(0, tag.find_first_of(" \t\r\n"));
        if (name.empty())
            throw runtime_error("Invalid XML: Missing tag name!");

        if (!depth) {
            if (selfClosing) {
                result.push_back({name, string_view()});
            } else {
                currentName = name;
                contentStart = pos;
                depth = 1;
            }
        } else if (!selfClosing) {
            depth++;
        }
    }
    if (depth)
        throw runtime_error("Invalid XML: Unterminated element!");
    return result;
}
//---------------------------------------------------------------------------
optional<string_view> XmlReader::child(string_view content, string_view tag)
// The first direct child
{
    for (auto& element : elements(content))
        if (element.name == tag)
            return element.content;
    return nullopt;
}
//---------------------------------------------------------------------------
vector<string_view> XmlReader::children(string_view content, string_view tag)
// All direct children
{
    vector<string_view> result;
    for (auto& element : elements(content))
        if (element.name == tag)
            result.push_back(element.content);
    return result;
}
//---------------------------------------------------------------------------
vector<string_view> XmlReader::items(string_view content, string_view setTag)
// The items of a set
{
    auto set = child(content, setTag);
    if (!set)
        return {};
    return children(*set, "item");
}
//---------------------------------------------------------------------------
string XmlReader::text(string_view content, string_view tag, string_view fallback)
// The decoded text
{
    auto value = child(content, tag);
    if (!value)
        return string(fallback);
    return decode(*value);
}
//---------------------------------------------------------------------------
optional<string> XmlReader::optionalText(string_view content, string_view tag)
// The decoded text if present
{
    auto value = child(content, tag);
    if (!value || value->empty())
        return nullopt;
    return decode(*value);
}
//---------------------------------------------------------------------------
string XmlReader::decode(string_view raw)
// Decode entities and unwrap CDATA
{
    static constexpr string_view strCData = "<![CDATA[";
    static constexpr string_view strCDataEnd = "]]>";
    if (raw.starts_with(strCData) && raw.ends_with(strCDataEnd))
        return string(raw.substr(strCData.size(), raw.size() - strCData.size() - strCDataEnd.size()));

    string result;
    result.reserve(raw.size());
    size_t pos = 0;
    while (pos < raw.size()) {
        auto amp = raw.find('&', pos);
        if (amp == raw.npos) {
            result += raw.substr(pos);
            break;
        }
        result += raw.substr(pos, amp - pos);
        auto semicolon = raw.find(';', amp);
        if (semicolon == raw.npos)
            throw runtime_error("Invalid XML: Unterminated entity!");
        auto entity = raw.substr(amp + 1, semicolon - amp - 1);
        if (entity == "lt") {
            result += '<';
        } else if (entity == "gt") {
            result += '>';
        } else if (entity == "amp") {
            result += '&';
        } else if (entity == "quot") {
            result += '"';
        } else if (entity == "apos") {
            result += '\'';
        } else if (entity.starts_with('#') && entity.size() > 1) {
            uint32_t codePoint = 0;
            auto hex = entity[1] == 'x' || entity[1] == 'X';
            auto digits = entity.substr(hex ? 2 : 1);
            auto [ptr, ec] = from_chars(digits.data(), digits.data() + digits.size(), codePoint, hex ? 16 : 10);
            if (ec != errc() || ptr != digits.data() + digits.size() || codePoint > 0x10FFFF)
                throw runtime_error("Invalid XML: Bad character reference!");
            appendUtf8(result, codePoint);
        } else {
            throw runtime_error("Invalid XML: Unknown entity!");
        }
        pos = semicolon + 1;
    }
    return result;
}
//---------------------------------------------------------------------------
} // namespace utils
} // namespace ec2scout
