#pragma once

#include <string>

namespace text
{
// True for the words of the fixed English stop list. |word| must be lowercase.
bool IsStopWord(std::string const & word);
}  // namespace text
