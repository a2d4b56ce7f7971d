#pragma once

#include <string>
#include <vector>

namespace text
{
/// Splits |s| into lowercase word tokens.
/// Digits and the symbols ?!@#$%^&*_+ are stripped first, a token is a run of at least
/// two letters (non-ASCII bytes count as letters) and stop words are dropped.
std::vector<std::string> Tokenize(std::string const & s);
}  // namespace text
