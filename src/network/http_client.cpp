#include "network/http_client.hpp"
#include "network/http_helper.hpp"
#include "network/tls_connection.hpp"
#include "network/tls_context.hpp"
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
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
HttpClient::HttpClient(TcpConnection::Timeouts timeouts) : _timeouts(timeouts)
// The constructor
{
}
//---------------------------------------------------------------------------
HttpClient::~HttpClient() noexcept = default;
//---------------------------------------------------------------------------
Transport::Response HttpClient::execute(const Endpoint& endpoint, const HttpRequest& request)
// Exchange the request
{
    auto addresses = _resolver.resolve(endpoint.host, to_string(endpoint.port));
    TcpConnection socket(addresses, _timeouts);

    unique_ptr<TLSConnection> tls;
    if (endpoint.https) {
        if (!_tlsContext)
            _tlsContext = make_unique<TLSContext>();
        tls = make_unique<TLSConnection>(*_tlsContext, socket, endpoint.host);
    }
    Stream& stream = tls ? static_cast<Stream&>(*tls) : static_cast<Stream&>(socket);

    auto message = request;
    message.headers.emplace("Connection", "close");
    stream.send(HttpRequest::serialize(message));

    string data;
    auto buffer = make_unique<char[]>(chunkSize);
    unique_ptr<HttpHelper::Info> info;
    while (true) {
        auto received = stream.recv(buffer.get(), chunkSize);
        data.append(buffer.get(), received);
        if (HttpHelper::finished(data, info, received == 0))
            break;
    }

    Response response;
    response.content = HttpHelper::retrieveContent(data, info);
    response.header = move(info->response);
    return response;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace ec2scout
