#include "ragline_api/server.hpp"

namespace ragline_api {

Server::Server(const std::string &host, int port, int threads)
    : host_(host), port_(port), threads_(threads) {}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(static_cast<uint16_t>(port_))
        .bindaddr(host_)
        .concurrency(static_cast<uint16_t>(threads_))
        .run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}

}  // namespace ragline_api
