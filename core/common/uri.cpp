/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/uri.hpp"

#include <algorithm>
#include <cctype>

namespace eraoracle::common {

  namespace {
    bool is_schema_char(char ch) {
      return std::isalpha(static_cast<unsigned char>(ch));
    }

    bool is_host_char(char ch) {
      return std::isalnum(static_cast<unsigned char>(ch)) or ch == '.'
          or ch == '-' or ch == '_';
    }

    bool is_digit(char ch) {
      return std::isdigit(static_cast<unsigned char>(ch));
    }
  }  // namespace

  std::string Uri::to_string() const {
    std::string result;
    if (not Schema.empty()) {
      result += Schema;
      result += "://";
    }
    result += Host;
    if (not Port.empty()) {
      result += ":";
      result += Port;
    }
    result += Path;
    if (not Query.empty()) {
      result += "?";
      result += Query;
    }
    if (not Fragment.empty()) {
      result += "#";
      result += Fragment;
    }
    return result;
  }

  std::optional<uint16_t> Uri::port() const {
    if (not Port.empty()) {
      return static_cast<uint16_t>(std::stoul(Port));
    }
    if (Schema == "ws" or Schema == "http") {
      return 80;
    }
    if (Schema == "wss" or Schema == "https") {
      return 443;
    }
    return std::nullopt;
  }

  std::string Uri::target() const {
    std::string result = Path.empty() ? "/" : Path;
    if (not Query.empty()) {
      result += "?";
      result += Query;
    }
    return result;
  }

  Uri Uri::parse(std::string_view uri) {
    Uri result;

    if (uri.empty()) {
      result.error_.emplace("Empty uri");
      return result;
    }

    auto set_error = [&](std::string_view message) {
      if (not result.error_.has_value()) {
        result.error_.emplace(message);
      }
    };

    // Schema
    size_t pos = 0;
    if (auto delim = uri.find("://"); delim != std::string_view::npos) {
      result.Schema.assign(uri.substr(0, delim));
      pos = delim + 3;
      if (result.Schema.empty()
          or not std::all_of(
              result.Schema.begin(), result.Schema.end(), is_schema_char)) {
        set_error("Invalid schema");
      }
    }

    // Host
    auto host_end = uri.find_first_of(":/?#", pos);
    if (host_end == std::string_view::npos) {
      host_end = uri.size();
    }
    result.Host.assign(uri.substr(pos, host_end - pos));
    if (result.Host.empty()
        or not std::all_of(
            result.Host.begin(), result.Host.end(), is_host_char)) {
      set_error("Invalid hostname");
    }
    pos = host_end;

    // Port
    if (pos < uri.size() and uri[pos] == ':') {
      ++pos;
      auto port_end = uri.find_first_of("/?#", pos);
      if (port_end == std::string_view::npos) {
        port_end = uri.size();
      }
      result.Port.assign(uri.substr(pos, port_end - pos));
      pos = port_end;
      if (result.Port.empty() or result.Port.size() > 5
          or not std::all_of(result.Port.begin(), result.Port.end(), is_digit)
          or std::stoul(result.Port) == 0 or std::stoul(result.Port) > 65535) {
        set_error("Invalid port");
      }
    }

    // Path
    auto path_end = uri.find_first_of("?#", pos);
    if (path_end == std::string_view::npos) {
      path_end = uri.size();
    }
    result.Path.assign(uri.substr(pos, path_end - pos));
    pos = path_end;

    // Query
    if (pos < uri.size() and uri[pos] == '?') {
      ++pos;
      auto query_end = uri.find('#', pos);
      if (query_end == std::string_view::npos) {
        query_end = uri.size();
      }
      result.Query.assign(uri.substr(pos, query_end - pos));
      pos = query_end;
    }

    // Fragment
    if (pos < uri.size() and uri[pos] == '#') {
      result.Fragment.assign(uri.substr(pos + 1));
    }

    return result;
  }

}  // namespace eraoracle::common
