#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "api_router.hpp"
#include "errors.hpp"
#include "httplib.h"
#include "session_manager.hpp"
#include "streaming_options.hpp"
#include "types.hpp"

// Malformed or missing request parameter.
class BadRequestError : public CamBridgeError {
public:
  using CamBridgeError::CamBridgeError;
};

namespace http {

std::string json_array(const std::vector<std::string> &items);
std::string build_error_json(const std::string &msg,
                             const std::string &details = "");

std::string prepare_response_json(const PrepareResponse &resp,
                                  AddressFamily family);
std::string capabilities_json(const StreamingOptions &opts);
std::string sessions_json(const std::vector<std::string> &pending,
                          const std::vector<std::string> &ongoing);

// Request parsing; throw BadRequestError.
PrepareRequest parse_prepare(const std::string &session_id,
                             const httplib::Request &req);
VideoRequest parse_video(const httplib::Request &req);
StartRequest parse_start(const std::string &session_id,
                         const httplib::Request &req);

struct ErrorReply {
  int status = 500;
  std::string error;
  std::string details;
};

// HTTP status and error code for a failed completion.
ErrorReply classify_error(const std::exception_ptr &error);

// Runs fn on the io_context thread and blocks the calling (httplib worker)
// thread until fn's completion fires. fn receives
// done(std::exception_ptr, T) and must call it exactly once.
template <typename T, typename Fn>
T run_on_loop(boost::asio::io_context &io, Fn fn,
              std::chrono::milliseconds deadline) {
  auto promise = std::make_shared<std::promise<T>>();
  std::future<T> result = promise->get_future();
  boost::asio::post(io, [promise, fn]() mutable {
    auto done = [promise](std::exception_ptr error, T value) {
      if (error)
        promise->set_exception(error);
      else
        promise->set_value(std::move(value));
    };
    try {
      fn(done);
    } catch (const std::exception &) {
      promise->set_exception(std::current_exception());
    }
  });
  if (result.wait_for(deadline) != std::future_status::ready)
    throw ProcessRuntimeError("Request did not complete in time.");
  return result.get();
}

struct ApiOptions {
  // Upper bound for one request, covering transcoder startup.
  std::chrono::milliseconds deadline{60000};
};

void add_routes(ApiRouter &router, boost::asio::io_context &io,
                SessionManager &manager, ApiOptions opts = {});

} // namespace http
