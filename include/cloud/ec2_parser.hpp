#pragma once
#include "cloud/ec2_api.hpp"
#include "cloud/ec2_model.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// EC2Scout Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2scout {
namespace cloud {
//---------------------------------------------------------------------------
/// Parses the XML responses of the EC2 query API
class EC2Parser {
    public:
    /// Parse a DescribeInstancesResponse page
    [[nodiscard]] static std::vector<Reservation> parseReservations(std::string_view xml);
    /// Parse a DescribeVolumesResponse page
    [[nodiscard]] static std::vector<Volume> parseVolumes(std::string_view xml);
    /// The pagination token of a page, empty on the last page
    [[nodiscard]] static std::string nextToken(std::string_view xml);
    /// Build the error from an error response
    [[nodiscard]] static EC2Error parseError(std::string_view xml, uint16_t status);

    private:
    /// Get the content of the root element, throws on error responses and unexpected roots
    [[nodiscard]] static std::string_view root(std::string_view xml, std::string_view expected);
    /// Parse an instancesSet item
    [[nodiscard]] static Instance parseInstance(std::string_view item);
    /// Parse a volumeSet item
    [[nodiscard]] static Volume parseVolume(std::string_view item);
    /// Parse an integer field
    [[nodiscard]] static int64_t parseInteger(std::string_view value, std::string_view field);
    /// Parse a boolean field, missing is false
    [[nodiscard]] static bool parseBool(std::string_view content, std::string_view field);
    /// Convert an element without a dedicated field, item lists become arrays
    [[nodiscard]] static nlohmann::ordered_json convertElement(std::string_view name, std::string_view content);
    /// The PascalCase field name of a tag, e.g. networkInterfaceSet is NetworkInterfaces
    [[nodiscard]] static std::string fieldName(std::string_view tag);
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace ec2scout
