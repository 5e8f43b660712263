/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "rpc/rpc_connection.hpp"

#include <chrono>
#include <functional>
#include <memory>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/variant.hpp>

#include "common/uri.hpp"
#include "log/logger.hpp"

namespace eraoracle::rpc {

  /**
   * Blocking json-rpc client over a websocket (ws or wss). Every operation
   * runs the private io_context until it completes or the timeout elapses.
   */
  class WsRpcConnection final : public RpcConnection {
   public:
    using Timeout = std::chrono::milliseconds;
    using PeerVerifier =
        std::function<bool(bool, boost::asio::ssl::verify_context &)>;

    /// Accepts a verified chain only if its leaf certificate matches `host`
    static PeerVerifier peerVerifier(const std::string &host);

    WsRpcConnection(common::Uri uri, Timeout timeout);
    WsRpcConnection(const WsRpcConnection &) = delete;
    WsRpcConnection(WsRpcConnection &&) = delete;
    ~WsRpcConnection() override;

    /**
     * Resolves host, connects, performs TLS (for wss) and websocket
     * handshakes
     */
    outcome::result<void> connect();

    const std::string &url() const override;

    outcome::result<std::string> call(std::string_view method,
                                      std::string_view params) override;

    void close() override;

   private:
    using TcpStream = boost::beast::tcp_stream;
    using SslStream = boost::beast::ssl_stream<TcpStream>;
    template <typename T>
    using WsStream = boost::beast::websocket::stream<T>;
    using WsTcpStream = WsStream<TcpStream>;
    using WsSslStream = WsStream<SslStream>;
    using WsTcpStreamPtr = std::unique_ptr<WsTcpStream>;
    using WsSslStreamPtr = std::unique_ptr<WsSslStream>;
    using Done = std::function<void(boost::system::error_code)>;

    TcpStream &stream_lowest_layer();

    /**
     * Starts an async operation and runs io_context until it calls `done` or
     * the deadline is reached. On timeout the socket is closed.
     */
    outcome::result<void> await(
        const std::function<void(Done)> &initiate,
        std::chrono::steady_clock::time_point deadline,
        RpcError on_failure);

    outcome::result<std::string> readResponse(
        uint64_t id, std::chrono::steady_clock::time_point deadline);

    void dropConnection();

    const common::Uri uri_;
    const std::string url_;
    const Timeout timeout_;
    bool secure_;
    bool connected_ = false;
    uint64_t next_request_id_ = 1;

    boost::asio::io_context io_context_;
    boost::asio::ssl::context ssl_ctx_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::variant<WsTcpStreamPtr, WsSslStreamPtr> ws_;
    boost::beast::flat_buffer buffer_;

    log::Logger log_;
  };

}  // namespace eraoracle::rpc
