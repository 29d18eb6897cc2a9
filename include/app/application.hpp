#pragma once
#include "app/options.hpp"
#include "cloud/ec2_api.hpp"
#include <iosfwd>
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
/// The console front end of the lookup
class Application {
    public:
    /// Success, also if nothing was found
    static constexpr int exitSuccess = 0;
    /// The lookup or the output failed
    static constexpr int exitFailure = 1;
    /// Invalid command line
    static constexpr int exitUsage = 2;

    /// Run the lookup and report, returns the exit code
    [[nodiscard]] static int run(const Options& options, cloud::EC2Api& api, std::ostream& out, std::ostream& err);
    /// Write the document, the parent directories are created
    static void writeReport(const std::string& path, const std::string& document);
};
//---------------------------------------------------------------------------
} // namespace app
} // namespace ec2scout
