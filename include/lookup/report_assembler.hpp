#pragma once
#include "lookup/records.hpp"
#include <string>
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
namespace lookup {
//---------------------------------------------------------------------------
/// Builds the structured result, the JSON document and the textual report.
/// JSON field names follow the EC2 API (PascalCase) and keep insertion order.
class ReportAssembler {
    public:
    /// The marker for absent optional volume fields
    static constexpr const char* notApplicable = "N/A";

    /// Build the result, all timestamps are normalized
    [[nodiscard]] static ReportResult toResult(const std::string& name, const std::string& region, std::vector<InstanceRecord> instances);
    /// The JSON document of the result
    [[nodiscard]] static nlohmann::ordered_json toJson(const ReportResult& result);
    /// The JSON document indented by two spaces
    [[nodiscard]] static std::string serialize(const ReportResult& result);
    /// The textual report, one entry per line
    [[nodiscard]] static std::vector<std::string> render(const std::vector<InstanceRecord>& instances);
    /// The console summary of the structured mode
    [[nodiscard]] static std::vector<std::string> summary(const ReportResult& result);

    /// The JSON of an instance
    [[nodiscard]] static nlohmann::ordered_json instanceToJson(const InstanceRecord& instance);
    /// The JSON of a volume
    [[nodiscard]] static nlohmann::ordered_json volumeToJson(const VolumeRecord& volume);

    private:
    /// Render the storage block
    static void renderStorage(const InstanceRecord& instance, std::vector<std::string>& lines);
};
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
