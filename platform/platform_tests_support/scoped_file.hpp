#pragma once

#include <cstdint>
#include <string>

namespace platform
{
namespace tests_support
{
// Temporary file in the system temp directory, removed on destruction.
class ScopedFile
{
public:
  enum class Mode : uint8_t
  {
    Create,
    DoNotCreate
  };

  ScopedFile(std::string const & relativePath, Mode mode);
  ScopedFile(std::string const & relativePath, std::string const & contents);
  ~ScopedFile();

  ScopedFile(ScopedFile const &) = delete;
  ScopedFile & operator=(ScopedFile const &) = delete;

  std::string const & GetFullPath() const { return m_fullPath; }
  bool Exists() const;

private:
  std::string m_fullPath;
};

std::string DebugPrint(ScopedFile const & file);
}  // namespace tests_support
}  // namespace platform
