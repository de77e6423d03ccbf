#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ppt::util {

// Percent-encodes every byte outside the RFC 3986 unreserved set.
std::string urlEncode(std::string_view s);

// application/x-www-form-urlencoded body from key/value pairs, in order.
std::string formEncode(const std::vector<std::pair<std::string, std::string>>& fields);

// Quoted OData string literal: single quotes doubled.
std::string odataLiteral(std::string_view s);

// https:// added when no scheme is present; trailing slashes stripped.
std::string normalizeBaseUrl(std::string_view url);

void trimInPlace(std::string& s);

}
