#include "platform/http_client.hpp"

#include "base/assert.hpp"
#include "base/logging.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <sstream>

using namespace std;

namespace
{
struct ResponseBuffer
{
  string * m_data = nullptr;
  size_t m_maxBytes = 0;
};

size_t WriteCallback(void * contents, size_t size, size_t nmemb, void * userp)
{
  size_t const realSize = size * nmemb;
  auto * buffer = static_cast<ResponseBuffer *>(userp);
  // Returning less than |realSize| makes curl abort the transfer with CURLE_WRITE_ERROR.
  if (buffer->m_data->size() + realSize > buffer->m_maxBytes)
    return 0;
  buffer->m_data->append(static_cast<char const *>(contents), realSize);
  return realSize;
}

void GlobalInit()
{
  static once_flag initFlag;
  call_once(initFlag, []() {
    CURLcode const code = curl_global_init(CURL_GLOBAL_DEFAULT);
    CHECK_EQUAL(code, CURLE_OK, ("curl_global_init failed:", curl_easy_strerror(code)));
  });
}

struct CurlDeleter
{
  void operator()(CURL * curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter
{
  void operator()(curl_slist * list) const { curl_slist_free_all(list); }
};
}  // namespace

namespace platform
{
int constexpr HttpClient::kNoError;
long constexpr HttpClient::kTimeoutSec;
size_t constexpr HttpClient::kMaxResponseBytes;

HttpClient::HttpClient(string const & url) : m_urlRequested(url) {}

HttpClient & HttpClient::SetBodyData(string const & data, string const & contentType)
{
  m_bodyData = data;
  m_contentType = contentType;
  m_httpMethod = "POST";
  return *this;
}

HttpClient & HttpClient::SetUserAgent(string const & userAgent)
{
  m_userAgent = userAgent;
  return *this;
}

bool HttpClient::RunHttpRequest()
{
  GlobalInit();

  m_errorCode = kNoError;
  m_errorMessage.clear();
  m_responseCode = 0;
  m_serverResponse.clear();

  unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl)
  {
    m_errorCode = CURLE_FAILED_INIT;
    m_errorMessage = "curl_easy_init failed";
    LOG(LWARNING, (m_errorMessage, m_urlRequested));
    return false;
  }

  curl_slist * rawHeaders = nullptr;
  if (!m_contentType.empty())
    rawHeaders = curl_slist_append(rawHeaders, ("Content-Type: " + m_contentType).c_str());
  unique_ptr<curl_slist, SlistDeleter> headers(rawHeaders);

  ResponseBuffer buffer{&m_serverResponse, kMaxResponseBytes};

  CURL * handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, m_urlRequested.c_str());
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_TIMEOUT, kTimeoutSec);
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &buffer);
  if (!m_userAgent.empty())
    curl_easy_setopt(handle, CURLOPT_USERAGENT, m_userAgent.c_str());
  if (headers)
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());

  if (m_httpMethod == "POST")
  {
    curl_easy_setopt(handle, CURLOPT_POST, 1L);
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, m_bodyData.c_str());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(m_bodyData.size()));
  }

  CURLcode const code = curl_easy_perform(handle);
  if (code != CURLE_OK)
  {
    m_errorCode = static_cast<int>(code);
    m_errorMessage = curl_easy_strerror(code);
    LOG(LDEBUG, ("Request failed:", DebugPrint(*this)));
    return false;
  }

  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &m_responseCode);
  LOG(LDEBUG, ("Request done:", DebugPrint(*this)));
  return true;
}

string DebugPrint(HttpClient const & request)
{
  ostringstream ostr;
  ostr << "HttpClient " << request.UrlRequested() << " code: " << request.ResponseCode();
  if (request.ErrorCode() != HttpClient::kNoError)
    ostr << " error: " << request.ErrorCode() << " " << request.ErrorMessage();
  return ostr.str();
}
}  // namespace platform
