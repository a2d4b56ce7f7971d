#include "text/tokenizer.hpp"

#include "text/stop_words.hpp"

#include <cstring>

using namespace std;

namespace
{
size_t const kMinTokenLength = 2;
char const * const kStrippedChars = "?!@#$%^&*_+";

bool IsStripped(char c)
{
  return (c >= '0' && c <= '9') || strchr(kStrippedChars, c) != nullptr;
}

bool IsWordChar(char c)
{
  auto const u = static_cast<unsigned char>(c);
  return (c >= 'a' && c <= 'z') || u >= 0x80;
}
}  // namespace

namespace text
{
vector<string> Tokenize(string const & s)
{
  vector<string> tokens;
  string token;

  auto const flush = [&]() {
    if (token.size() >= kMinTokenLength && !IsStopWord(token))
      tokens.push_back(token);
    token.clear();
  };

  for (char c : s)
  {
    if (c == '\0' || IsStripped(c))
      continue;
    if (c >= 'A' && c <= 'Z')
      c = static_cast<char>(c - 'A' + 'a');
    if (IsWordChar(c))
      token.push_back(c);
    else
      flush();
  }
  flush();

  return tokens;
}
}  // namespace text
