#include "app/options.hpp"
#include <charconv>
#include <cstring>
#include <string_view>
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
using namespace std;
//---------------------------------------------------------------------------
string Options::helpText()
// The usage
{
    string helpText = "ec2scout server_name [OPTIONS]\n\n";
    helpText += "Get EC2 instance details by server name (EC2 Name tag)\n\n";
    helpText += "OPTIONS:\n";
    helpText += "-r, --region region (default: ap-southeast-2)\n";
    helpText += "-o, --output JSON output file (default: output/{server_name}_details.json)\n";
    helpText += "--human human-readable output instead of JSON\n";
    helpText += "--endpoint host[:port] custom EC2 endpoint\n";
    helpText += "--http plain http for the custom endpoint\n";
    helpText += "-h, --help show this help\n";
    return helpText;
}
//---------------------------------------------------------------------------
static void parseEndpoint(const string& value, Options& options)
// Split host[:port]
{
    auto pos = value.rfind(':');
    options.endpoint = value.substr(0, pos);
    if (options.endpoint.empty())
        throw UsageError("Invalid endpoint: " + value);
    if (pos == string::npos)
        return;

    auto port = string_view(value).substr(pos + 1);
    uint32_t number = 0;
    auto [ptr, ec] = from_chars(port.data(), port.data() + port.size(), number);
    if (ec != errc() || ptr != port.data() + port.size() || !number || number > 65535)
        throw UsageError("Invalid endpoint port: " + value);
    options.port = number;
}
//---------------------------------------------------------------------------
Options Options::parse(int argc, const char* const* argv)
// Parse the arguments
{
    Options options;
    auto value = [&](int& i) -> string {
        if ((i + 1) >= argc)
            throw UsageError(string("Missing value for ") + argv[i]);
        return argv[++i];
    };

    for (auto i = 1; i < argc; i++) {
        if (!strcmp(argv[i], "-h") || !strcmp(argv[i], "--help")) {
            options.help = true;
        } else if (!strcmp(argv[i], "-r") || !strcmp(argv[i], "--region")) {
            options.region = value(i);
        } else if (!strcmp(argv[i], "-o") || !strcmp(argv[i], "--output")) {
            options.output = value(i);
        } else if (!strcmp(argv[i], "--human")) {
            options.human = true;
        } else if (!strcmp(argv[i], "--endpoint")) {
            parseEndpoint(value(i), options);
        } else if (!strcmp(argv[i], "--http")) {
            options.https = false;
        } else if (argv[i][0] == '-' && argv[i][1]) {
            throw UsageError(string("Unknown option: ") + argv[i]);
        } else if (options.serverName.empty()) {
            options.serverName = argv[i];
        } else {
            throw UsageError(string("Unexpected argument: ") + argv[i]);
        }
    }

    if (!options.help && options.serverName.empty())
        throw UsageError("Missing server_name");
    return options;
}
//---------------------------------------------------------------------------
string Options::defaultOutputPath(const string& serverName)
// The derived path
{
    auto cleanName = serverName;
    for (auto& c : cleanName)
        if (c == '/' || c == '\\')
            c = '_';
    return "output/" + cleanName + "_details.json";
}
//---------------------------------------------------------------------------
string Options::outputPath() const
// The effective path
{
    if (output && !output->empty())
        return *output;
    return defaultOutputPath(serverName);
}
//---------------------------------------------------------------------------
} // namespace app
} // namespace ec2scout
