#pragma once

#include "base/exception.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace geolocator
{
// Reads stories line by line from a json lines file, gzip compressed when the name
// ends with ".gz".
class StoryReader
{
public:
  DECLARE_EXCEPTION(Exception, RootException);
  DECLARE_EXCEPTION(OpenException, Exception);

  explicit StoryReader(std::string const & path);
  explicit StoryReader(std::istream & in);

  // Reads the next non-empty line. Returns false at the end of input.
  bool Read(std::string & line);

  uint64_t GetLinesRead() const { return m_linesRead; }

  static std::unique_ptr<std::istream> CreateDataStream(std::string const & path);

private:
  std::unique_ptr<std::istream> m_fileStream;
  std::istream & m_in;
  uint64_t m_linesRead = 0;
};

// Reads a reference corpus, one text per line, gzip compressed when the name ends
// with ".gz". Lines are trimmed; empty ones are kept as empty texts.
std::vector<std::string> ReadCorpus(std::string const & path);

// Writes resolved stories as json lines to a file (gzip compressed when the name ends
// with ".gz") or to stdout when the path is empty.
class StoryWriter
{
public:
  DECLARE_EXCEPTION(Exception, RootException);
  DECLARE_EXCEPTION(OpenException, Exception);

  explicit StoryWriter(std::string const & path);
  explicit StoryWriter(std::ostream & out);

  void Write(std::string const & line);
  void Flush();

  uint64_t GetLinesWritten() const { return m_linesWritten; }

private:
  static std::unique_ptr<std::ostream> CreateDataStream(std::string const & path);

  std::unique_ptr<std::ostream> m_fileStream;
  std::ostream & m_out;
  uint64_t m_linesWritten = 0;
};
}  // namespace geolocator
