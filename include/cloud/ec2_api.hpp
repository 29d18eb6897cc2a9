#pragma once
#include "cloud/ec2_model.hpp"
#include <stdexcept>
#include <string>
#include <utility>
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
namespace cloud {
//---------------------------------------------------------------------------
/// An error response of the EC2 API
class EC2Error : public std::runtime_error {
    /// The AWS error code, e.g. AuthFailure
    std::string _code;

    public:
    /// The constructor
    EC2Error(std::string code, const std::string& message) : std::runtime_error(code + ": " + message), _code(std::move(code)) {}
    /// Get the error code
    [[nodiscard]] const std::string& code() const noexcept { return _code; }
};
//---------------------------------------------------------------------------
/// A DescribeInstances filter, the values are or-ed
struct Filter {
    std::string name;
    std::vector<std::string> values;
};
//---------------------------------------------------------------------------
/// The EC2 operations used by the lookup, all pages are collected
class EC2Api {
    public:
    /// The destructor
    virtual ~EC2Api() noexcept = default;
    /// Get the reservations matching all filters
    [[nodiscard]] virtual std::vector<Reservation> describeInstances(const std::string& region, const std::vector<Filter>& filters) = 0;
    /// Get the volumes with the ids
    [[nodiscard]] virtual std::vector<Volume> describeVolumes(const std::string& region, const std::vector<std::string>& volumeIds) = 0;
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace ec2scout
