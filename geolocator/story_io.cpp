#include "geolocator/story_io.hpp"

#include "base/logging.hpp"
#include "base/string_utils.hpp"

#include <utility>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

using namespace std;

namespace geolocator
{
StoryReader::StoryReader(string const & path)
  : m_fileStream{CreateDataStream(path)}, m_in{*m_fileStream}
{
}

StoryReader::StoryReader(istream & in) : m_in{in} {}

bool StoryReader::Read(string & line)
{
  while (getline(m_in, line))
  {
    ++m_linesRead;
    strings::Trim(line);
    if (!line.empty())
      return true;
  }

  if (m_in.bad())
    MYTHROW(Exception, ("Read error after", m_linesRead, "lines"));
  return false;
}

// static
unique_ptr<istream> StoryReader::CreateDataStream(string const & path)
{
  using namespace boost::iostreams;
  auto fileStream = make_unique<filtering_istream>();

  if (strings::EndsWith(path, ".gz"))
    fileStream->push(gzip_decompressor());

  file_source file(path, ios_base::in | ios_base::binary);
  if (!file.is_open())
    MYTHROW(OpenException, ("Failed to open file", path));
  fileStream->push(move(file));

  return fileStream;
}

vector<string> ReadCorpus(string const & path)
{
  auto const in = StoryReader::CreateDataStream(path);

  vector<string> corpus;
  string line;
  while (getline(*in, line))
  {
    strings::Trim(line);
    corpus.push_back(move(line));
  }

  if (in->bad())
    MYTHROW(StoryReader::Exception, ("Read error after", corpus.size(), "corpus lines of", path));
  return corpus;
}

StoryWriter::StoryWriter(string const & path)
  : m_fileStream{path.empty() ? nullptr : CreateDataStream(path)}
  , m_out{m_fileStream ? *m_fileStream : cout}
{
}

StoryWriter::StoryWriter(ostream & out) : m_out{out} {}

void StoryWriter::Write(string const & line)
{
  m_out << line << '\n';
  if (!m_out)
    MYTHROW(Exception, ("Write error after", m_linesWritten, "lines"));
  ++m_linesWritten;
}

void StoryWriter::Flush()
{
  m_out.flush();
  if (!m_out)
    MYTHROW(Exception, ("Flush error after", m_linesWritten, "lines"));
}

// static
unique_ptr<ostream> StoryWriter::CreateDataStream(string const & path)
{
  using namespace boost::iostreams;
  auto fileStream = make_unique<filtering_ostream>();

  if (strings::EndsWith(path, ".gz"))
    fileStream->push(gzip_compressor());

  file_sink file(path, ios_base::out | ios_base::binary | ios_base::trunc);
  if (!file.is_open())
    MYTHROW(OpenException, ("Failed to open file", path));
  fileStream->push(move(file));

  return fileStream;
}
}  // namespace geolocator
