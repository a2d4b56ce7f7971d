#include "platform/platform_tests_support/scoped_file.hpp"

#include "base/assert.hpp"
#include "base/logging.hpp"

#include <fstream>

#include <boost/filesystem.hpp>

using namespace std;

namespace fs = boost::filesystem;

namespace
{
string MakeUniquePath(string const & relativePath)
{
  auto const dir = fs::temp_directory_path() / fs::unique_path("geolocator-%%%%-%%%%-%%%%");
  fs::create_directories(dir);
  return (dir / relativePath).string();
}
}  // namespace

namespace platform
{
namespace tests_support
{
ScopedFile::ScopedFile(string const & relativePath, Mode mode)
  : ScopedFile(relativePath, string() /* contents */)
{
  if (mode == Mode::DoNotCreate)
    fs::remove(m_fullPath);
}

ScopedFile::ScopedFile(string const & relativePath, string const & contents)
  : m_fullPath(MakeUniquePath(relativePath))
{
  ofstream os(m_fullPath, ios::binary);
  CHECK(os.is_open(), ("Can't create", m_fullPath));
  os << contents;
  os.close();
  CHECK(!os.fail(), ("Can't write", m_fullPath));
}

ScopedFile::~ScopedFile()
{
  boost::system::error_code ec;
  fs::remove_all(fs::path(m_fullPath).parent_path(), ec);
  if (ec)
    LOG(LWARNING, ("Can't remove", m_fullPath, ec.message()));
}

bool ScopedFile::Exists() const { return fs::exists(m_fullPath); }

string DebugPrint(ScopedFile const & file)
{
  return "ScopedFile [" + file.GetFullPath() + "]";
}
}  // namespace tests_support
}  // namespace platform
