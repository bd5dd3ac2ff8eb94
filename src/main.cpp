#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include "address_resolver.hpp"
#include "api_router.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http_api.hpp"
#include "httplib.h"
#include "logger.hpp"
#include "session_manager.hpp"

int main(int argc, char *argv[]) {
  AppConfig cfg;
  try {
    cfg = parse_config(argc, argv);
  } catch (const ConfigurationError &e) {
    std::cerr << e.what() << "\n\n" << usage();
    return 2;
  }
  if (cfg.show_help) {
    std::cout << usage();
    return 0;
  }

  Logger log;
  boost::asio::io_context io;
  SystemAddressResolver resolver;

  SessionManager::Options opts;
  opts.name = cfg.name;
  opts.video = cfg.video;
  opts.processor = cfg.processor;
  opts.interface_name = cfg.interface_name;
  opts.ready_timeout = std::chrono::milliseconds(cfg.ready_timeout_ms);
  opts.kill_grace = std::chrono::milliseconds(cfg.kill_grace_ms);

  std::unique_ptr<SessionManager> manager;
  try {
    manager = std::make_unique<SessionManager>(io, log, resolver, opts);
  } catch (const ConfigurationError &e) {
    log.error(e.what(), cfg.name);
    return 2;
  }

  httplib::Server svr;
  ApiRouter router(log);
  http::add_routes(router, io, *manager);
  router.register_with(svr);
  svr.set_error_handler([](const httplib::Request &, httplib::Response &res) {
    if (res.status == 404)
      res.set_content(http::build_error_json("not_found"), "application/json");
    else if (res.body.empty())
      res.set_content(http::build_error_json("error"), "application/json");
  });

  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int signo) {
    if (ec)
      return;
    log.info("Got signal " + std::to_string(signo) + ", shutting down.");
    manager->shutdown([&svr]() { svr.stop(); });
  });

  auto work = boost::asio::make_work_guard(io);
  std::thread loop([&io]() { io.run(); });

  log.info("CamBridge listening on " + cfg.addr + ":" +
               std::to_string(cfg.port) + " (processor " + cfg.processor +
               ", max streams " + std::to_string(cfg.video.max_streams) + ")",
           cfg.name);
  const bool listened = svr.listen(cfg.addr, cfg.port);
  if (!listened)
    log.error("Failed to listen on " + cfg.addr + ":" +
                  std::to_string(cfg.port),
              cfg.name);

  // Reached after a signal or a bind failure; no-op if already shut down.
  std::promise<void> stopped;
  boost::asio::post(io, [&]() {
    signals.cancel();
    manager->shutdown([&stopped]() { stopped.set_value(); });
  });
  stopped.get_future().wait();

  work.reset();
  io.stop();
  loop.join();
  manager.reset();
  return listened ? 0 : 1;
}
