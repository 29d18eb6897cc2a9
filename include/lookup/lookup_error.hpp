#pragma once
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
namespace lookup {
//---------------------------------------------------------------------------
/// The instance lookup failed, nothing was resolved
class LookupError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
} // namespace lookup
} // namespace ec2scout
