/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rpc/impl/ws_rpc_connection.hpp"

#include <optional>

#include <fmt/format.h>
#include <openssl/tls1.h>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "rpc/rpc_error.hpp"

namespace eraoracle::rpc {

  namespace {
    std::string serialize(const rapidjson::Value &value) {
      rapidjson::StringBuffer buffer;
      rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
      value.Accept(writer);
      return {buffer.GetString(), buffer.GetSize()};
    }
  }  // namespace

  WsRpcConnection::WsRpcConnection(common::Uri uri, Timeout timeout)
      : uri_{std::move(uri)},
        url_{uri_.to_string()},
        timeout_{timeout},
        secure_{uri_.isSecure()},
        ssl_ctx_{boost::asio::ssl::context::tls_client},
        resolver_{io_context_},
        log_{log::createLogger("WsRpcConnection", "rpc_transport")} {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(boost::asio::ssl::verify_peer);
    if (secure_) {
      ws_ = std::make_unique<WsSslStream>(io_context_, ssl_ctx_);
    } else {
      ws_ = std::make_unique<WsTcpStream>(io_context_);
    }
  }

  WsRpcConnection::PeerVerifier WsRpcConnection::peerVerifier(
      const std::string &host) {
    return boost::asio::ssl::host_name_verification(host);
  }

  WsRpcConnection::~WsRpcConnection() {
    close();
  }

  const std::string &WsRpcConnection::url() const {
    return url_;
  }

  WsRpcConnection::TcpStream &WsRpcConnection::stream_lowest_layer() {
    return secure_ ? boost::beast::get_lowest_layer(
               *boost::relaxed_get<WsSslStreamPtr>(ws_))
                   : boost::beast::get_lowest_layer(
                       *boost::relaxed_get<WsTcpStreamPtr>(ws_));
  }

  outcome::result<void> WsRpcConnection::await(
      const std::function<void(Done)> &initiate,
      std::chrono::steady_clock::time_point deadline,
      RpcError on_failure) {
    std::optional<boost::system::error_code> result;
    initiate([&result](boost::system::error_code ec) { result = ec; });

    io_context_.restart();
    while (not result.has_value() and not io_context_.stopped()) {
      if (io_context_.run_one_until(deadline) == 0) {
        break;
      }
    }

    if (not result.has_value()) {
      // the pending handler refers to `result`, so it must run before return
      boost::system::error_code ignored;
      stream_lowest_layer().socket().close(ignored);
      io_context_.restart();
      io_context_.run();
      connected_ = false;
      return RpcError::TIMEOUT;
    }

    if (*result) {
      SL_DEBUG(log_, "Operation on {} failed: {}", url_, result->message());
      if (*result == boost::beast::websocket::error::closed
          or *result == boost::asio::error::eof) {
        return RpcError::CONNECTION_CLOSED;
      }
      return on_failure;
    }
    return outcome::success();
  }

  outcome::result<void> WsRpcConnection::connect() {
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    auto port = uri_.port();
    if (not port.has_value()) {
      return EndpointUrlError::UNSUPPORTED_SCHEMA;
    }

    SL_DEBUG(log_, "Connecting to endpoint {}", url_);

    boost::asio::ip::tcp::resolver::results_type endpoints;
    OUTCOME_TRY(await(
        [&](Done done) {
          resolver_.async_resolve(
              uri_.Host,
              std::to_string(*port),
              [&endpoints, done](boost::system::error_code ec,
                                 auto results) {
                endpoints = std::move(results);
                done(ec);
              });
        },
        deadline,
        RpcError::CONNECTION_FAILED));

    OUTCOME_TRY(await(
        [&](Done done) {
          stream_lowest_layer().async_connect(
              endpoints,
              [done](boost::system::error_code ec, const auto &) { done(ec); });
        },
        deadline,
        RpcError::CONNECTION_FAILED));

    if (secure_) {
      auto &ws = *boost::relaxed_get<WsSslStreamPtr>(ws_);
      // Set SNI Hostname (many hosts need this to handshake successfully)
      if (not SSL_set_tlsext_host_name(ws.next_layer().native_handle(),
                                       uri_.Host.c_str())) {
        SL_WARN(log_, "Unable to set SNI hostname for {}", url_);
        return RpcError::CONNECTION_FAILED;
      }
      boost::system::error_code ec;
      ws.next_layer().set_verify_callback(peerVerifier(uri_.Host), ec);
      if (ec) {
        SL_WARN(log_,
                "Unable to set certificate host check for {}: {}",
                url_,
                ec.message());
        return RpcError::CONNECTION_FAILED;
      }
      OUTCOME_TRY(await(
          [&](Done done) {
            ws.next_layer().async_handshake(
                boost::asio::ssl::stream_base::client,
                [done](boost::system::error_code ec) { done(ec); });
          },
          deadline,
          RpcError::CONNECTION_FAILED));
    }

    auto handshake_host = uri_.Host + ":" + std::to_string(*port);
    auto target = uri_.target();
    OUTCOME_TRY(await(
        [&](Done done) {
          boost::apply_visitor(
              [&](auto &ws) {
                ws->set_option(boost::beast::websocket::stream_base::decorator(
                    [](boost::beast::websocket::request_type &req) {
                      req.set(boost::beast::http::field::user_agent,
                              std::string(BOOST_BEAST_VERSION_STRING)
                                  + " era-oracle");
                    }));
                ws->read_message_max(64 * 1024 * 1024);
                ws->async_handshake(
                    handshake_host,
                    target,
                    [done](boost::system::error_code ec) { done(ec); });
              },
              ws_);
        },
        deadline,
        RpcError::CONNECTION_FAILED));

    connected_ = true;
    SL_INFO(log_, "Connected to {}", url_);
    return outcome::success();
  }

  outcome::result<std::string> WsRpcConnection::call(std::string_view method,
                                                     std::string_view params) {
    if (not connected_) {
      return RpcError::NOT_CONNECTED;
    }
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    auto id = next_request_id_++;
    auto request = fmt::format(
        R"({{"jsonrpc":"2.0","id":{},"method":"{}","params":{}}})",
        id,
        method,
        params.empty() ? "[]" : params);

    SL_TRACE(log_, "-> {}: {}", url_, request);

    auto write_res = await(
        [&](Done done) {
          boost::apply_visitor(
              [&](auto &ws) {
                ws->text(true);
                ws->async_write(boost::asio::buffer(request),
                                [done](boost::system::error_code ec,
                                       std::size_t) { done(ec); });
              },
              ws_);
        },
        deadline,
        RpcError::CONNECTION_FAILED);
    if (write_res.has_error()) {
      dropConnection();
      return write_res.error();
    }

    auto response = readResponse(id, deadline);
    if (response.has_error() and isConnectivityError(response.error())) {
      dropConnection();
    }
    return response;
  }

  outcome::result<std::string> WsRpcConnection::readResponse(
      uint64_t id, std::chrono::steady_clock::time_point deadline) {
    while (true) {
      buffer_.clear();
      OUTCOME_TRY(await(
          [&](Done done) {
            boost::apply_visitor(
                [&](auto &ws) {
                  ws->async_read(buffer_,
                                 [done](boost::system::error_code ec,
                                        std::size_t) { done(ec); });
                },
                ws_);
          },
          deadline,
          RpcError::CONNECTION_FAILED));

      auto text = boost::beast::buffers_to_string(buffer_.data());
      SL_TRACE(log_, "<- {}: {}", url_, text);

      rapidjson::Document document;
      document.Parse(text.data(), text.size());
      if (document.HasParseError() or not document.IsObject()) {
        return RpcError::MALFORMED_RESPONSE;
      }

      auto id_it = document.FindMember("id");
      if (id_it == document.MemberEnd() or not id_it->value.IsUint64()) {
        // subscription notifications and other unsolicited messages
        continue;
      }
      if (id_it->value.GetUint64() != id) {
        SL_DEBUG(log_,
                 "Response #{} from {} is ignored, waiting for #{}",
                 id_it->value.GetUint64(),
                 url_,
                 id);
        continue;
      }

      if (auto error_it = document.FindMember("error");
          error_it != document.MemberEnd()) {
        SL_DEBUG(log_,
                 "Node {} returned error: {}",
                 url_,
                 serialize(error_it->value));
        return RpcError::REMOTE_ERROR;
      }

      auto result_it = document.FindMember("result");
      if (result_it == document.MemberEnd()) {
        return RpcError::MALFORMED_RESPONSE;
      }
      return serialize(result_it->value);
    }
  }

  void WsRpcConnection::dropConnection() {
    connected_ = false;
    boost::system::error_code ignored;
    stream_lowest_layer().socket().close(ignored);
  }

  void WsRpcConnection::close() {
    if (not connected_) {
      return;
    }
    connected_ = false;
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    auto res = await(
        [&](Done done) {
          boost::apply_visitor(
              [&](auto &ws) {
                ws->async_close(
                    boost::beast::websocket::close_code::normal,
                    [done](boost::system::error_code ec) { done(ec); });
              },
              ws_);
        },
        deadline,
        RpcError::CONNECTION_CLOSED);
    if (res.has_error()) {
      SL_DEBUG(log_,
               "Connection to {} was not closed gracefully: {}",
               url_,
               res.error().message());
    }
    boost::system::error_code ignored;
    stream_lowest_layer().socket().close(ignored);
    SL_DEBUG(log_, "Disconnected from {}", url_);
  }

}  // namespace eraoracle::rpc
