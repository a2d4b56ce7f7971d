#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace text
{
size_t constexpr kDefaultMentionsLimit = 6;

// Splits |s| on '.', '!' and '?' followed by whitespace or the end of text.
// Sentences are trimmed, empty ones are dropped.
std::vector<std::string> SplitSentences(std::string const & s);

// Returns, in text order, at most |limit| sentences of |s| containing |place| verbatim.
std::vector<std::string> FindMentions(std::string const & place, std::string const & s,
                                      size_t limit = kDefaultMentionsLimit);
}  // namespace text
