#pragma once
#include <cstdint>
#include <optional>
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
namespace app {
//---------------------------------------------------------------------------
/// Invalid command line
class UsageError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
/// The command line options
struct Options {
    /// The Name tag to search for
    std::string serverName;
    /// The region, ap-southeast-2 if unset
    std::optional<std::string> region;
    /// The JSON output file
    std::optional<std::string> output;
    /// Print the textual report instead of writing JSON
    bool human = false;
    /// The custom EC2 endpoint host
    std::string endpoint;
    /// The custom EC2 endpoint port, 0 for the scheme default
    uint32_t port = 0;
    /// Use TLS
    bool https = true;
    /// Print the help
    bool help = false;

    /// Parse the arguments, throws UsageError
    [[nodiscard]] static Options parse(int argc, const char* const* argv);
    /// The help text
    [[nodiscard]] static std::string helpText();
    /// output/<name>_details.json with path separators of the name replaced
    [[nodiscard]] static std::string defaultOutputPath(const std::string& serverName);
    /// The effective output path
    [[nodiscard]] std::string outputPath() const;
};
//---------------------------------------------------------------------------
} // namespace app
} // namespace ec2scout
