#pragma once

#include <string>
#include <utility>
#include <vector>

namespace coding
{
using UrlParams = std::vector<std::pair<std::string, std::string>>;

// Percent-encodes |s| as application/x-www-form-urlencoded data, unreserved characters
// (RFC 3986) are kept as is.
std::string UrlEncode(std::string const & s);

// Joins |params| as "k1=v1&k2=v2" with both keys and values encoded.
std::string EncodeParams(UrlParams const & params);

// Appends encoded |params| to |baseUrl| as a query string.
std::string MakeUrl(std::string const & baseUrl, UrlParams const & params);
}  // namespace coding
