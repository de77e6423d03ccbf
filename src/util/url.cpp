#include "util/url.hpp"
#include "http/Curl.hpp"

#include <algorithm>
#include <cctype>

namespace ppt::util {

std::string urlEncode(const std::string_view s) {
    if (s.empty()) return {};

    http::ensureCurlGlobalInit();
    http::CurlEasy h;
    char* escaped = curl_easy_escape(h, s.data(), static_cast<int>(s.size()));
    if (!escaped) throw std::runtime_error("curl_easy_escape failed");
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string formEncode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& [k, v] : fields) {
        if (!out.empty()) out += '&';
        out += urlEncode(k);
        out += '=';
        out += urlEncode(v);
    }
    return out;
}

std::string odataLiteral(const std::string_view s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') out += "''";
        else out += c;
    }
    out += '\'';
    return out;
}

std::string normalizeBaseUrl(const std::string_view url) {
    std::string out(url);
    trimInPlace(out);
    if (out.empty()) return out;
    if (out.find("://") == std::string::npos) out = "https://" + out;
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

void trimInPlace(std::string& s) {
    const auto notSpace = [](const unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

}
