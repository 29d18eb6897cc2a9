#include "app/application.hpp"
#include "lookup/instance_resolver.hpp"
#include "lookup/lookup_error.hpp"
#include "lookup/pipeline.hpp"
#include "lookup/report_assembler.hpp"
#include <filesystem>
#include <fstream>
#include <ostream>
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
namespace app {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
void Application::writeReport(const string& path, const string& document)
// Write the file
{
    filesystem::path file(path);
    if (file.has_parent_path()) {
        error_code ec;
        filesystem::create_directories(file.parent_path(), ec);
        if (ec)
            throw runtime_error("Cannot create directory " + file.parent_path().string() + ": " + ec.message());
    }

    ofstream stream(file, ios::out | ios::trunc);
    if (!stream)
        throw runtime_error("Cannot open " + path);
    stream << document << "\n";
    stream.close();
    if (!stream)
        throw runtime_error("Cannot write " + path);
}
//---------------------------------------------------------------------------
int Application::run(const Options& options, cloud::EC2Api& api, ostream& out, ostream& err)
// The console flow
{
    out << "Searching for EC2 instance: " << options.serverName << endl;
    if (options.region && !options.region->empty())
        out << "Region: " << *options.region << endl;
    else
        out << "Region: " << lookup::InstanceResolver::defaultRegion << " (default)" << endl;

    optional<lookup::ReportResult> result;
    try {
        lookup::LookupPipeline pipeline(api);
        result = pipeline.run(options.serverName, options.region);
    } catch (const lookup::LookupError& e) {
        err << "Error retrieving EC2 details: " << e.what() << endl;
        return exitFailure;
    }

    if (!result) {
        out << "No EC2 instances found with name: " << options.serverName << endl;
        return exitSuccess;
    }

    if (options.human) {
        for (auto& line : lookup::ReportAssembler::render(result->instances))
            out << line << "\n";
        out.flush();
        return exitSuccess;
    }

    auto path = options.outputPath();
    try {
        writeReport(path, lookup::ReportAssembler::serialize(*result));
    } catch (const runtime_error& e) {
        err << "Error writing EC2 details: " << e.what() << endl;
        return exitFailure;
    }
    out << "EC2 details written to: " << path << endl;
    for (auto& line : lookup::ReportAssembler::summary(*result))
        out << line << "\n";
    out.flush();
    return exitSuccess;
}
//---------------------------------------------------------------------------
} // namespace app
} // namespace ec2scout
