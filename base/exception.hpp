#pragma once

#include "base/internal/message.hpp"
#include "base/src_point.hpp"

#include <exception>
#include <string>

class RootException : public std::exception
{
public:
  RootException(char const * what, std::string const & msg);

  virtual ~RootException() noexcept = default;

  std::string const & Msg() const { return m_msg; }

  // Ideally, what() should be overridden in each subclass of RootException,
  // but we can't yet use template string literals here.
  virtual char const * what() const noexcept;

private:
  std::string m_whatWithAscii;
  std::string m_msg;
};

#define DECLARE_EXCEPTION(exception_name, base_exception)                    \
  class exception_name : public base_exception                               \
  {                                                                          \
  public:                                                                    \
    exception_name(char const * what, std::string const & msg)              \
      : base_exception(what, msg)                                            \
    {                                                                        \
    }                                                                        \
  }

#define MYTHROW(exception_name, msg) \
  throw exception_name(#exception_name, ::base::Message(SRC(), ::base::Message msg))

#define MYTHROW1(exception_name, param1, msg) \
  throw exception_name(param1, #exception_name, ::base::Message(SRC(), ::base::Message msg))
