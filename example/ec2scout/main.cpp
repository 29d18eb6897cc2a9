#include "app/application.hpp"
#include "app/options.hpp"
#include "cloud/aws_credentials.hpp"
#include "cloud/ec2.hpp"
#include "network/http_client.hpp"
#include <chrono>
#include <iostream>
//---------------------------------------------------------------------------
// EC2Scout - Instance Lookup and Volume Enrichment
// EC2Scout Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
using namespace ec2scout;
//---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    app::Options options;
    try {
        options = app::Options::parse(argc, argv);
    } catch (const app::UsageError& e) {
        cerr << e.what() << "\n\n"
             << app::Options::helpText() << endl;
        return app::Application::exitUsage;
    }
    if (options.help) {
        cout << app::Options::helpText() << endl;
        return app::Application::exitSuccess;
    }

    // The EC2 API client
    network::HttpClient client;
    cloud::EC2::Settings settings;
    settings.endpoint = options.endpoint;
    settings.https = options.https;
    settings.port = options.port ? options.port : (options.https ? 443 : 80);

    // Short timeouts for the link local metadata service
    network::HttpClient metadataClient({.connect = chrono::seconds(1), .io = chrono::seconds(2)});
    cloud::AWSCredentials credentials(metadataClient);

    cloud::EC2 ec2(client, credentials, settings);
    return app::Application::run(options, ec2, cout, cerr);
}
//---------------------------------------------------------------------------
