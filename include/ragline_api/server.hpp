#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace ragline_api {

// Runs a crow::SimpleApp on a background thread
class Server {
 public:
  Server(const std::string &host, int port, int threads);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();
  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  int threads_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};

}  // namespace ragline_api
