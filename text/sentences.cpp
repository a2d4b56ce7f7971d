#include "text/sentences.hpp"

#include "base/string_utils.hpp"

#include <cctype>

using namespace std;

namespace
{
bool IsTerminal(char c) { return c == '.' || c == '!' || c == '?'; }

bool IsSpace(char c) { return isspace(static_cast<unsigned char>(c)) != 0; }

void Flush(string & sentence, vector<string> & sentences)
{
  strings::Trim(sentence);
  if (!sentence.empty())
    sentences.push_back(sentence);
  sentence.clear();
}
}  // namespace

namespace text
{
vector<string> SplitSentences(string const & s)
{
  vector<string> sentences;
  string sentence;
  for (size_t i = 0; i < s.size(); ++i)
  {
    sentence.push_back(s[i]);
    if (IsTerminal(s[i]) && (i + 1 == s.size() || IsSpace(s[i + 1])))
      Flush(sentence, sentences);
  }
  Flush(sentence, sentences);
  return sentences;
}

vector<string> FindMentions(string const & place, string const & s, size_t limit)
{
  vector<string> mentions;
  if (place.empty())
    return mentions;

  for (auto & sentence : SplitSentences(s))
  {
    if (mentions.size() >= limit)
      break;
    if (sentence.find(place) != string::npos)
      mentions.push_back(move(sentence));
  }
  return mentions;
}
}  // namespace text
