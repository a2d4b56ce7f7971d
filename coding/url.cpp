#include "coding/url.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

using namespace std;

namespace coding
{
string UrlEncode(string const & s)
{
  ostringstream out;
  out << hex << uppercase;
  for (unsigned char const c : s)
  {
    if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
      out << c;
    else
      out << '%' << setw(2) << setfill('0') << static_cast<int>(c);
  }
  return out.str();
}

string EncodeParams(UrlParams const & params)
{
  string result;
  for (auto const & param : params)
  {
    if (!result.empty())
      result += '&';
    result += UrlEncode(param.first);
    result += '=';
    result += UrlEncode(param.second);
  }
  return result;
}

string MakeUrl(string const & baseUrl, UrlParams const & params)
{
  if (params.empty())
    return baseUrl;
  auto const delimiter = baseUrl.find('?') == string::npos ? '?' : '&';
  return baseUrl + delimiter + EncodeParams(params);
}
}  // namespace coding
