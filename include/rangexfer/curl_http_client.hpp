#pragma once

#include "http_client.hpp"
#include "transfer_config.hpp"

#include <memory>

namespace rangexfer {

class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(const TransferConfig& config = {});
    ~CurlHttpClient() override;

    [[nodiscard]] HttpResponse head(const HttpRequest& request) override;
    HttpResponse get(const HttpRequest& request,
                     const HeadersHandler& on_headers,
                     const DataHandler& on_data) override;
    HttpResponse post(const HttpRequest& request,
                      std::int64_t content_length,
                      const BodySource& body) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangexfer
