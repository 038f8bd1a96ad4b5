#pragma once
#include <curl/curl.h>

#include <string>

#include "unchessful/net/http_types.hpp"

namespace unchessful::net::detail {

// One configured easy handle plus the buffers libcurl writes into.
struct EasyExchange {
  CURL* easy = nullptr;
  curl_slist* headers = nullptr;
  std::string body;
  char errbuf[CURL_ERROR_SIZE]{};

  EasyExchange() = default;
  EasyExchange(const EasyExchange&) = delete;
  EasyExchange& operator=(const EasyExchange&) = delete;
  ~EasyExchange();

  // Creates and configures the handle. Returns false with `outError` set if
  // libcurl refused any part of the setup.
  bool setup(const HttpRequest& req, std::string* outError);
  // Maps a finished transfer to a response.
  HttpResponse finish(CURLcode code);
};

}  // namespace unchessful::net::detail
