#pragma once

#include "http/Curl.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace ppt::http {

struct Request {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

class Transport {
public:
    virtual ~Transport() = default;
    virtual HttpResponse send(const Request& req) = 0;
};

class CurlTransport : public Transport {
public:
    CurlTransport();
    HttpResponse send(const Request& req) override;
};

// Streams url into dest, overwriting it. Throws on transport or HTTP failure.
void download(const std::string& url, const std::filesystem::path& dest);

}
