#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
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
/// Depth aware view over the XML documents of the AWS query APIs.
/// All views point into the original buffer, which must outlive them.
/// Attributes are skipped and namespaces are kept as part of the name.
class XmlReader {
    public:
    /// A direct child element
    struct Element {
        /// The tag name
        std::string_view name;
        /// The raw content between start and end tag
        std::string_view content;
    };

    /// Get all direct child elements of the content
    [[nodiscard]] static std::vector<Element> elements(std::string_view content);
    /// Get the content of the first direct child with the tag
    [[nodiscard]] static std::optional<std::string_view> child(std::string_view content, std::string_view tag);
    /// Get the content of all direct children with the tag
    [[nodiscard]] static std::vector<std::string_view> children(std::string_view content, std::string_view tag);
    /// Get the <item> entries of a set, e.g. <groupSet><item/>...</groupSet>
    [[nodiscard]] static std::vector<std::string_view> items(std::string_view content, std::string_view setTag);
    /// Get the decoded text of the first direct child, fallback if missing
    [[nodiscard]] static std::string text(std::string_view content, std::string_view tag, std::string_view fallback = "");
    /// Get the decoded text of the first direct child, nullopt if missing or empty
    [[nodiscard]] static std::optional<std::string> optionalText(std::string_view content, std::string_view tag);
    /// Decode the predefined and numeric character entities
    [[nodiscard]] static std::string decode(std::string_view raw);
};
//---------------------------------------------------------------------------
} // namespace utils
} // namespace ec2scout
