#include "unchessful/engine/remote/request_channel.hpp"

#include <iostream>

#include "unchessful/engine/remote/cooperative_request_channel.hpp"
#include "unchessful/engine/remote/threaded_request_channel.hpp"
#include "unchessful/net/curl_transport.hpp"

namespace unchessful::engine {

std::unique_ptr<IRequestChannel> makeRequestChannel(const config::NetworkSettings& settings) {
  if (settings.scheduling == config::Scheduling::Cooperative) {
    std::cout << "[RequestChannel] cooperative scheduling (curl multi)\n";
    return std::make_unique<CooperativeRequestChannel>(
        std::make_shared<net::CurlMultiTransport>());
  }
  std::cout << "[RequestChannel] threaded scheduling, " << settings.workerThreads
            << " worker(s)\n";
  return std::make_unique<ThreadedRequestChannel>(std::make_shared<net::CurlTransport>(),
                                                  settings.workerThreads);
}

}  // namespace unchessful::engine
