#include "base/string_utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace strings
{
namespace
{
bool IsFinite(double d) { return std::isfinite(d); }
}  // namespace

void Trim(std::string & s)
{
  Trim(s, " \t\r\n\f\v");
}

void Trim(std::string & s, char const * anyOf)
{
  auto const first = s.find_first_not_of(anyOf);
  if (first == std::string::npos)
  {
    s.clear();
    return;
  }
  auto const last = s.find_last_not_of(anyOf);
  s = s.substr(first, last - first + 1);
}

bool StartsWith(std::string const & s1, std::string const & s2)
{
  return s1.size() >= s2.size() && s1.compare(0, s2.size(), s2) == 0;
}

bool EndsWith(std::string const & s1, std::string const & s2)
{
  return s1.size() >= s2.size() && s1.compare(s1.size() - s2.size(), s2.size(), s2) == 0;
}

void Tokenize(std::string const & str, char const * delims,
              std::function<void(std::string const &)> const & fn)
{
  size_t pos = 0;
  while (pos < str.size())
  {
    auto const start = str.find_first_not_of(delims, pos);
    if (start == std::string::npos)
      break;
    auto end = str.find_first_of(delims, start);
    if (end == std::string::npos)
      end = str.size();
    fn(str.substr(start, end - start));
    pos = end;
  }
}

std::vector<std::string> Tokenize(std::string const & str, char const * delims)
{
  std::vector<std::string> tokens;
  Tokenize(str, delims, [&tokens](std::string const & token) { tokens.push_back(token); });
  return tokens;
}

bool to_double(char const * s, double & d)
{
  if (!s || *s == '\0')
    return false;

  char * stop;
  errno = 0;
  double const x = std::strtod(s, &stop);
  if (errno == ERANGE || *stop != '\0' || !IsFinite(x))
    return false;

  d = x;
  return true;
}
}  // namespace strings
