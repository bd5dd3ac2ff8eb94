#include <future>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "api_router.hpp"
#include "base64.hpp"
#include "http_api.hpp"
#include "httplib.h"
#include "logger.hpp"
#include "session_manager.hpp"
#include "test_support.hpp"

namespace {
bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

httplib::Params prepare_params() {
  const std::string key = base64_encode(std::vector<uint8_t>(16, 0xA5));
  const std::string salt = base64_encode(std::vector<uint8_t>(14, 0x5A));
  return {
      {"address", "192.168.1.20"}, {"video_port", "51000"},
      {"video_srtp_key", key},     {"video_srtp_salt", salt},
      {"audio_port", "51002"},     {"audio_srtp_key", key},
      {"audio_srtp_salt", salt},
  };
}

httplib::Request request_with(const httplib::Params &params) {
  httplib::Request req;
  req.params = params;
  return req;
}

template <typename Fn> bool rejected_as_bad_request(Fn fn) {
  try {
    fn();
  } catch (const BadRequestError &) {
    return true;
  }
  return false;
}

void test_parsing() {
  auto req = request_with(prepare_params());
  const PrepareRequest p = http::parse_prepare("s1", req);
  log_test("Prepare request parsed",
           p.session_id == "s1" && p.target_address == "192.168.1.20" &&
               p.family == AddressFamily::V4 && p.video.port == 51000 &&
               p.audio.port == 51002 && p.video.srtp_key.size() == 16 &&
               p.video.srtp_salt.size() == 14 &&
               p.video.crypto_suite == CryptoSuite::AES_CM_128_HMAC_SHA1_80);

  auto v6 = prepare_params();
  v6.emplace("address_version", "ipv6");
  v6.emplace("audio_crypto_suite", "1");
  const PrepareRequest p6 = http::parse_prepare("s2", request_with(v6));
  log_test("IPv6 and explicit crypto suite",
           p6.family == AddressFamily::V6 &&
               p6.audio.crypto_suite == CryptoSuite::AES_256_CM_HMAC_SHA1_80);

  auto bad_key = prepare_params();
  bad_key.erase("video_srtp_key");
  bad_key.emplace("video_srtp_key", "not base64!");
  log_test("Invalid base64 key rejected", rejected_as_bad_request([&] {
             http::parse_prepare("s", request_with(bad_key));
           }));

  auto no_port = prepare_params();
  no_port.erase("audio_port");
  log_test("Missing port rejected", rejected_as_bad_request([&] {
             http::parse_prepare("s", request_with(no_port));
           }));

  auto bad_family = prepare_params();
  bad_family.emplace("address_version", "ipx");
  log_test("Unknown address version rejected", rejected_as_bad_request([&] {
             http::parse_prepare("s", request_with(bad_family));
           }));

  const StartRequest s = http::parse_start(
      "s1", request_with({{"width", "1920"},
                          {"height", "1080"},
                          {"fps", "30"},
                          {"video_bitrate", "299"},
                          {"audio_bitrate", "24"}}));
  log_test("Start request parsed with defaults",
           s.video.width == 1920 && s.video.height == 1080 &&
               s.video.fps == 30 && s.video.max_bit_rate == 299 &&
               s.video.pt == 99 && s.audio.max_bit_rate == 24 &&
               s.audio.sample_rate == 16 && s.audio.pt == 110);

  log_test("Non-numeric width rejected", rejected_as_bad_request([&] {
             http::parse_video(request_with(
                 {{"width", "12px"}, {"height", "10"}, {"fps", "10"}}));
           }));
  log_test("Zero fps rejected", rejected_as_bad_request([&] {
             http::parse_video(request_with(
                 {{"width", "640"}, {"height", "480"}, {"fps", "0"}}));
           }));
}

void test_error_mapping() {
  auto status_of = [](std::exception_ptr e) {
    return http::classify_error(e).status;
  };
  log_test("Bad request is 400",
           status_of(std::make_exception_ptr(BadRequestError("x"))) == 400);
  log_test("Session state is 409",
           status_of(std::make_exception_ptr(SessionStateError("x"))) == 409);
  log_test("Stream limit is 503",
           status_of(std::make_exception_ptr(StreamLimitError("x"))) == 503);
  log_test("Spawn failure is 502 stream_failed",
           http::classify_error(std::make_exception_ptr(ProcessSpawnError("x")))
                   .error == "stream_failed");
  const auto snap =
      http::classify_error(std::make_exception_ptr(SnapshotError("no frame")));
  log_test("Snapshot failure is 502 with details",
           snap.status == 502 && snap.error == "snapshot_failed" &&
               snap.details == "no frame");
}

void test_json() {
  log_test("Error JSON escapes details",
           http::build_error_json("bad_request", "say \"hi\"") ==
               "{\"error\":\"bad_request\",\"details\":\"say \\\"hi\\\"\"}");
  log_test("JSON array", http::json_array({"a", "b"}) == "[\"a\",\"b\"]");
  log_test("Sessions JSON",
           http::sessions_json({"p1"}, {}) ==
               "{\"pending\":[\"p1\"],\"ongoing\":[]}");

  PrepareResponse resp;
  resp.address = "192.168.1.5";
  resp.video = {40000, 42, {1, 2, 3}, {4}};
  resp.audio = {40002, -7, {}, {}};
  const std::string body = http::prepare_response_json(resp, AddressFamily::V4);
  log_test("Prepare response JSON",
           contains(body, "\"address\":\"192.168.1.5\"") &&
               contains(body, "\"address_version\":\"ipv4\"") &&
               contains(body, "\"video\":{\"port\":40000,\"ssrc\":42,"
                              "\"srtp_key\":\"AQID\",\"srtp_salt\":\"BA==\"}") &&
               contains(body, "\"ssrc\":-7"),
           body);

  log_test("Route pattern",
           route_pattern("/session/{id}/start") == "/session/([^/]+)/start");
}

void test_server_round_trip() {
  boost::asio::io_context io;
  auto work = boost::asio::make_work_guard(io);
  Logger log;
  log.set_capture(true);
  FakeResolver resolver;

  SessionManager::Options opts;
  opts.name = "Test";
  opts.video.source = "-i rtsp://cam/stream";
  opts.processor = "/bin/false";
  SessionManager manager(io, log, resolver, opts);
  std::thread loop([&io]() { io.run(); });

  ApiRouter router(log);
  http::add_routes(router, io, manager);
  httplib::Server svr;
  router.register_with(svr);
  const int port = svr.bind_to_any_port("127.0.0.1");
  std::thread server([&svr]() { svr.listen_after_bind(); });
  svr.wait_until_ready();

  httplib::Client cli("127.0.0.1", port);

  auto caps = cli.Get("/capabilities");
  log_test("GET /capabilities",
           caps && caps->status == 200 &&
               contains(caps->body, "\"stream_count\":2") &&
               contains(caps->body, "[320,240,15]") &&
               contains(caps->body, "\"codec\":\"AAC-ELD\""),
           caps ? caps->body : "no response");

  auto schema = cli.Get("/api/schema");
  log_test("GET /api/schema lists routes",
           schema && schema->status == 200 &&
               contains(schema->body, "/session/{id}/prepare") &&
               contains(schema->body, "\"type\":\"base64\""));

  auto prep = cli.Post("/session/abc/prepare", prepare_params());
  log_test("POST prepare",
           prep && prep->status == 200 &&
               contains(prep->body, "\"address\":\"192.168.1.5\""),
           prep ? prep->body : "no response");

  auto list = cli.Get("/sessions");
  log_test("GET /sessions shows pending session",
           list && list->body == "{\"pending\":[\"abc\"],\"ongoing\":[]}",
           list ? list->body : "no response");

  auto unsupported = prepare_params();
  unsupported.emplace("video_crypto_suite", "2");
  auto rej = cli.Post("/session/def/prepare", unsupported);
  log_test("Unsupported crypto suite is 409",
           rej && rej->status == 409 &&
               contains(rej->body, "\"error\":\"invalid_state\""),
           rej ? rej->body : "no response");

  auto missing = cli.Post("/session/xyz/start",
                          httplib::Params{{"width", "640"},
                                          {"height", "480"},
                                          {"fps", "10"}});
  log_test("Start without prepare is 409", missing && missing->status == 409,
           missing ? missing->body : "no response");

  auto bad = cli.Post("/session/abc/start", httplib::Params{{"width", "640"}});
  log_test("Start with missing params is 400", bad && bad->status == 400);

  auto reconf = cli.Post(
      "/session/abc/reconfigure",
      httplib::Params{{"width", "320"}, {"height", "240"}, {"fps", "15"}});
  log_test("Reconfigure acknowledged", reconf && reconf->status == 200);

  auto stop = cli.Post("/session/abc/stop", httplib::Params{});
  auto after = cli.Get("/sessions");
  log_test("POST stop discards pending session",
           stop && stop->status == 200 && after &&
               after->body == "{\"pending\":[],\"ongoing\":[]}");

  auto again = cli.Post("/session/abc/stop", httplib::Params{});
  log_test("Stopping an unknown session is a no-op",
           again && again->status == 200);

  svr.stop();
  server.join();

  std::promise<void> stopped;
  boost::asio::post(io, [&]() {
    manager.shutdown([&stopped]() { stopped.set_value(); });
  });
  stopped.get_future().wait();
  work.reset();
  io.stop();
  loop.join();
}
} // namespace

void test_http_api() {
  section("HTTP API");
  test_parsing();
  test_error_mapping();
  test_json();
  test_server_round_trip();
}
