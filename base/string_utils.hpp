#pragma once

#include <functional>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace strings
{
void Trim(std::string & s);
/// Remove any characters that contain in "anyOf" on left and right side of string s
void Trim(std::string & s, char const * anyOf);

bool StartsWith(std::string const & s1, std::string const & s2);
bool EndsWith(std::string const & s1, std::string const & s2);

/// Calls |fn| for every non-empty token of |str| separated by any of |delims|.
void Tokenize(std::string const & str, char const * delims,
              std::function<void(std::string const &)> const & fn);

std::vector<std::string> Tokenize(std::string const & str, char const * delims);

/// @return false if |s| is empty, has trailing garbage or is not a finite number.
bool to_double(char const * s, double & d);
inline bool to_double(std::string const & s, double & d) { return to_double(s.c_str(), d); }

template <typename Iterator, typename Delimiter>
typename Iterator::value_type JoinStrings(Iterator begin, Iterator end,
                                          Delimiter const & delimiter)
{
  if (begin == end)
    return {};

  auto result = *begin++;
  for (Iterator it = begin; it != end; ++it)
  {
    result += delimiter;
    result += *it;
  }

  return result;
}

template <typename Container, typename Delimiter>
typename Container::value_type JoinStrings(Container const & container,
                                           Delimiter const & delimiter)
{
  return JoinStrings(std::begin(container), std::end(container), delimiter);
}
}  // namespace strings
