#pragma once

#include <cstdio>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include "httplib.h"
#include "logger.hpp"

inline std::string json_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[7];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out += buf;
      } else {
        out += c;
      }
    }
  }
  return out;
}

enum class ParamType { String, Int, Base64, Select };

struct RouteParam {
  std::string name;
  ParamType type;
  std::string default_value; // "" = required or no default
  std::string description;
  std::vector<std::string> options; // Select only

  const char *type_label() const {
    switch (type) {
    case ParamType::Int:
      return "int";
    case ParamType::Base64:
      return "base64";
    case ParamType::Select:
      return "select";
    default:
      return "string";
    }
  }

  std::string to_json() const {
    std::ostringstream ss;
    ss << "{\"name\":\"" << json_escape(name) << "\",\"type\":\""
       << type_label() << "\",\"default\":\"" << json_escape(default_value)
       << "\",\"description\":\"" << json_escape(description) << "\"";
    if (!options.empty()) {
      ss << ",\"options\":[";
      for (size_t i = 0; i < options.size(); ++i) {
        if (i)
          ss << ",";
        ss << "\"" << json_escape(options[i]) << "\"";
      }
      ss << "]";
    }
    ss << "}";
    return ss.str();
  }
};

using RouteHandler =
    std::function<void(const httplib::Request &, httplib::Response &)>;

struct Route {
  std::string path; // "/session/{id}/start"
  std::string method;
  std::string description;
  std::vector<RouteParam> params;
  RouteHandler handler;

  std::string to_json() const {
    std::ostringstream ss;
    ss << "{\"path\":\"" << json_escape(path) << "\",\"method\":\""
       << json_escape(method) << "\",\"description\":\""
       << json_escape(description) << "\",\"params\":[";
    for (size_t i = 0; i < params.size(); ++i) {
      if (i)
        ss << ",";
      ss << params[i].to_json();
    }
    ss << "]}";
    return ss.str();
  }
};

// "{name}" segments become "([^/]+)" capture groups, in order.
inline std::string route_pattern(const std::string &path) {
  std::string out = path;
  size_t pos = 0;
  while ((pos = out.find('{', pos)) != std::string::npos) {
    const size_t end = out.find('}', pos);
    if (end == std::string::npos)
      break;
    out.replace(pos, end - pos + 1, "([^/]+)");
    pos += 7;
  }
  return out;
}

// Route table that registers itself with an httplib server and describes
// itself at GET /api/schema.
class ApiRouter {
public:
  explicit ApiRouter(Logger &log) : log_(log) {}

  void add_route(Route route) { routes_.push_back(std::move(route)); }
  const std::vector<Route> &routes() const { return routes_; }

  void register_with(httplib::Server &svr) {
    for (const auto &route : routes_) {
      const std::string pattern = route_pattern(route.path);
      log_.info("Registering " + route.method + " " + route.path);
      if (route.method == "GET")
        svr.Get(pattern, route.handler);
      else if (route.method == "POST")
        svr.Post(pattern, route.handler);
      else
        log_.warn("Skipping route with unsupported method " + route.method);
    }
    svr.Get("/api/schema",
            [this](const httplib::Request &, httplib::Response &res) {
              res.set_content(schema_json(), "application/json");
            });
  }

  std::string schema_json() const {
    std::string out = "[";
    for (size_t i = 0; i < routes_.size(); ++i) {
      if (i)
        out += ",";
      out += routes_[i].to_json();
    }
    out += "]";
    return out;
  }

private:
  Logger &log_;
  std::vector<Route> routes_;
};
