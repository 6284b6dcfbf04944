#ifndef HOLDEM_CURL_HTTP_TRANSPORT_HPP
#define HOLDEM_CURL_HTTP_TRANSPORT_HPP

#include "oracle/http_transport.hpp"

namespace holdem_eval {

// Transport libcurl : un handle "easy" par requête, donc sans état partagé.
class CurlHttpTransport : public HttpTransport {
public:
    CurlHttpTransport();

    HttpResponse get(const std::string& url,
                     const QueryParams& query,
                     std::chrono::milliseconds timeout) override;
};

} // namespace holdem_eval

#endif // HOLDEM_CURL_HTTP_TRANSPORT_HPP
