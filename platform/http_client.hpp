#pragma once

#include <cstddef>
#include <string>

namespace platform
{
// Blocking HTTP(S) client. One instance serves one request; it is cheap to construct
// and instances may be used from different threads concurrently.
class HttpClient
{
public:
  static int constexpr kNoError = -1;
  static long constexpr kTimeoutSec = 30;
  static size_t constexpr kMaxResponseBytes = 16 * 1024 * 1024;

  HttpClient() = default;
  explicit HttpClient(std::string const & url);

  // Synchronous (blocking) call, should be implemented for each platform
  // @returns true if connection was made and server returned something (200, 404, etc.).
  // @note Implementations should transparently support all needed HTTP redirects.
  bool RunHttpRequest();

  // Sets the body of a POST request and switches the method to POST.
  HttpClient & SetBodyData(std::string const & data, std::string const & contentType);
  HttpClient & SetUserAgent(std::string const & userAgent);

  std::string const & UrlRequested() const { return m_urlRequested; }
  // @returns kNoError if there was no transport error, or a curl error code.
  int ErrorCode() const { return m_errorCode; }
  // Transport error description, empty when ErrorCode() is kNoError.
  std::string const & ErrorMessage() const { return m_errorMessage; }
  // HTTP status of the last request, 0 if no response was received.
  long ResponseCode() const { return m_responseCode; }
  bool WasSuccessful() const { return m_responseCode >= 200 && m_responseCode < 300; }
  std::string const & ServerResponse() const { return m_serverResponse; }

private:
  std::string m_urlRequested;
  std::string m_httpMethod = "GET";
  std::string m_bodyData;
  std::string m_contentType;
  std::string m_userAgent;

  int m_errorCode = kNoError;
  std::string m_errorMessage;
  long m_responseCode = 0;
  std::string m_serverResponse;
};

std::string DebugPrint(HttpClient const & request);
}  // namespace platform
