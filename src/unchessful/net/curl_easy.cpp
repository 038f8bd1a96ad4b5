#include "curl_easy.hpp"

#include <iostream>

#include "unchessful/net/curl_transport.hpp"

namespace unchessful::net {

const char* toString(TransferResult r) {
  switch (r) {
    case TransferResult::Completed:
      return "completed";
    case TransferResult::Failed:
      return "failed";
    case TransferResult::Aborted:
      return "aborted";
  }
  return "unknown";
}

std::shared_ptr<CurlGlobal> CurlGlobal::acquire() {
  static std::mutex mutex;
  static std::weak_ptr<CurlGlobal> current;
  std::lock_guard lock(mutex);
  if (auto alive = current.lock()) return alive;
  std::shared_ptr<CurlGlobal> fresh(new CurlGlobal());
  current = fresh;
  return fresh;
}

CurlGlobal::CurlGlobal() {
  const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  m_ok = rc == CURLE_OK;
  if (!m_ok) std::cerr << "[Http] curl_global_init failed: " << curl_easy_strerror(rc) << "\n";
}

CurlGlobal::~CurlGlobal() {
  if (m_ok) curl_global_cleanup();
}

namespace detail {

namespace {

size_t writeBody(char* data, size_t size, size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  body->append(data, size * nmemb);
  return size * nmemb;
}

template <class T>
bool setOpt(CURL* easy, CURLoption opt, T value, std::string* outError) {
  const CURLcode rc = curl_easy_setopt(easy, opt, value);
  if (rc == CURLE_OK) return true;
  if (outError) *outError = curl_easy_strerror(rc);
  return false;
}

}  // namespace

EasyExchange::~EasyExchange() {
  if (headers) curl_slist_free_all(headers);
  if (easy) curl_easy_cleanup(easy);
}

bool EasyExchange::setup(const HttpRequest& req, std::string* outError) {
  easy = curl_easy_init();
  if (!easy) {
    if (outError) *outError = "curl_easy_init failed";
    return false;
  }

  for (const auto& h : req.headers) {
    curl_slist* next = curl_slist_append(headers, h.c_str());
    if (!next) {
      if (outError) *outError = "curl_slist_append failed";
      return false;
    }
    headers = next;
  }

  bool ok = setOpt(easy, CURLOPT_URL, req.url.c_str(), outError) &&
            setOpt(easy, CURLOPT_NOSIGNAL, 1L, outError) &&
            setOpt(easy, CURLOPT_FOLLOWLOCATION, 1L, outError) &&
            setOpt(easy, CURLOPT_ERRORBUFFER, errbuf, outError) &&
            setOpt(easy, CURLOPT_WRITEFUNCTION, &writeBody, outError) &&
            setOpt(easy, CURLOPT_WRITEDATA, static_cast<void*>(&body), outError);
  if (ok && headers) ok = setOpt(easy, CURLOPT_HTTPHEADER, headers, outError);
  if (ok && !req.userAgent.empty())
    ok = setOpt(easy, CURLOPT_USERAGENT, req.userAgent.c_str(), outError);
  if (ok && req.connectTimeoutMs > 0)
    ok = setOpt(easy, CURLOPT_CONNECTTIMEOUT_MS, req.connectTimeoutMs, outError);
  if (ok && req.totalTimeoutMs > 0)
    ok = setOpt(easy, CURLOPT_TIMEOUT_MS, req.totalTimeoutMs, outError);
  if (ok && req.method == HttpMethod::Post) {
    ok = setOpt(easy, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()), outError) &&
         setOpt(easy, CURLOPT_COPYPOSTFIELDS, req.body.c_str(), outError);
  }
  return ok;
}

HttpResponse EasyExchange::finish(CURLcode code) {
  HttpResponse resp;
  if (code == CURLE_ABORTED_BY_CALLBACK) {
    resp.result = TransferResult::Aborted;
    resp.error = "transfer aborted";
    return resp;
  }
  if (code != CURLE_OK) {
    resp.result = TransferResult::Failed;
    resp.error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(code));
    return resp;
  }

  long status = 0;
  const CURLcode info = curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);
  if (info != CURLE_OK) {
    resp.result = TransferResult::Failed;
    resp.error = curl_easy_strerror(info);
    return resp;
  }
  resp.result = TransferResult::Completed;
  resp.status = status;
  resp.body = std::move(body);
  return resp;
}

}  // namespace detail

}  // namespace unchessful::net
