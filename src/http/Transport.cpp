#include "http/Transport.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <fstream>
#include <mutex>

namespace ppt::http {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

CurlTransport::CurlTransport() { ensureCurlGlobalInit(); }

HttpResponse CurlTransport::send(const Request& req) {
    SList headers;
    for (const auto& [k, v] : req.headers) headers.add(fmt::format("{}: {}", k, v));

    log::Registry::http()->debug("[CurlTransport] {} {}", req.method, req.url);

    auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());

        if (req.method == "GET") {
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        } else if (req.method == "POST") {
            curl_easy_setopt(h, CURLOPT_POST, 1L);
        } else {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        }

        if (req.method != "GET" && req.method != "DELETE") {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
        }
    });

    if (resp.curl != CURLE_OK)
        log::Registry::http()->warn("[CurlTransport] {} {} failed: {}", req.method, req.url,
                                    curl_easy_strerror(resp.curl));
    else
        log::Registry::http()->debug("[CurlTransport] {} {} -> HTTP {}", req.method, req.url, resp.http);

    return resp;
}

void download(const std::string& url, const std::filesystem::path& dest) {
    ensureCurlGlobalInit();

    std::ofstream file(dest, std::ios::binary | std::ios::trunc);
    if (!file) throw std::runtime_error("Failed to open download target: " + dest.string());

    auto writeFn = +[](const char* ptr, const size_t size, const size_t nmemb, void* userdata) -> size_t {
        auto* fout = static_cast<std::ofstream*>(userdata);
        fout->write(ptr, static_cast<std::streamsize>(size * nmemb));
        return size * nmemb;
    };

    CurlEasy h;
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeFn);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &file);

    log::Registry::http()->info("[download] {} -> {}", url, dest.string());

    const CURLcode res = curl_easy_perform(h);
    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    file.close();

    if (res != CURLE_OK) throw std::runtime_error(
        fmt::format("Download of {} failed: {}", url, curl_easy_strerror(res)));
    if (status / 100 != 2) throw std::runtime_error(
        fmt::format("Download of {} failed with HTTP {}", url, status));
}

}
