#include "cloud/transport/CurlMechanism.hpp"
#include "util/curlWrappers.hpp"
#include "util/errors.hpp"

using namespace ts::cloud::transport;
using namespace ts::util;

Response CurlMechanism::send(const Request& req) {
    HeaderList hdrs;
    for (const auto& [k, v] : req.headers) hdrs.add(k, v);
    if (!req.body.empty()) hdrs.add("Content-Type", "application/json");

    CurlHandle h;
    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    h.timeout(req.timeout);
    h.method(req.method, req.body);

    auto res = perform(h);
    if (res.code != CURLE_OK)
        throw TransportError("libcurl " + req.method + " " + req.url + " failed: " + res.error);

    Response out;
    out.status = res.status;
    out.body = std::move(res.body);
    out.headers = parseHeaderBlock(res.rawHeaders);
    return out;
}
