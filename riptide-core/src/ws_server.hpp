#pragma once

#include "broadcaster.hpp"
#include "event_schema.hpp"
#include <ixwebsocket/IXWebSocketServer.h>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace riptide {

// Subscriber backed by one server-side ixwebsocket connection.
class WebSocketSubscriber : public Subscriber {
public:
  static constexpr size_t MAX_BUFFERED_BYTES = 1024 * 1024;

  WebSocketSubscriber(std::string id, std::weak_ptr<ix::WebSocket> ws)
    : id_(std::move(id)), ws_(std::move(ws)) {}

  const std::string& id() const override { return id_; }

  bool send(const std::string& message, std::chrono::milliseconds timeout) override {
    auto ws = ws_.lock();
    if (!ws || ws->getReadyState() != ix::ReadyState::Open) {
      return false;
    }

    // A client that cannot drain its buffer within the timeout is dropped.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (ws->bufferedAmount() > MAX_BUFFERED_BYTES) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    return ws->send(message, false).success;
  }

  void close() override {
    if (auto ws = ws_.lock()) {
      ws->close();
    }
  }

private:
  std::string id_;
  std::weak_ptr<ix::WebSocket> ws_;
};

class WSServer {
public:
  WSServer(uint16_t port, const std::string& host, Broadcaster& broadcaster)
    : port_(port), host_(host), broadcaster_(broadcaster),
      server_(static_cast<int>(port), host) {}

  ~WSServer() { stop(); }

  WSServer(const WSServer&) = delete;
  WSServer& operator=(const WSServer&) = delete;

  bool start() {
    server_.setOnClientMessageCallback(
      [this](std::shared_ptr<ix::ConnectionState> state,
             ix::WebSocket& ws,
             const ix::WebSocketMessagePtr& msg) {
        handle_message(state, ws, msg);
      }
    );

    auto res = server_.listen();
    if (!res.first) {
      std::cerr << "[Riptide] WebSocket server failed to listen on port "
                << port_ << ": " << res.second << std::endl;
      return false;
    }

    server_.start();
    running_.store(true, std::memory_order_release);
    std::cout << "[Riptide] WebSocket server listening on ws://" << host_ << ":"
              << port_ << std::endl;
    return true;
  }

  void stop() {
    if (running_.exchange(false, std::memory_order_acq_rel)) {
      broadcaster_.close_all();
      server_.stop();
      std::cout << "[Riptide] WebSocket server stopped" << std::endl;
    }
  }

  bool is_running() const {
    return running_.load(std::memory_order_acquire);
  }

private:
  void handle_message(
    std::shared_ptr<ix::ConnectionState> state,
    ix::WebSocket& ws,
    const ix::WebSocketMessagePtr& msg
  ) {
    switch (msg->type) {
      case ix::WebSocketMessageType::Open: {
        std::cout << "[Riptide] Client connected: " << state->getRemoteIp()
                  << " (id: " << state->getId() << ")" << std::endl;

        auto shared = find_client(ws);
        if (!shared) {
          std::cerr << "[Riptide] Connection " << state->getId()
                    << " not tracked by server, ignoring" << std::endl;
          break;
        }
        ws.send(hello_message().dump());
        broadcaster_.register_subscriber(
          std::make_shared<WebSocketSubscriber>(state->getId(), shared)
        );
        break;
      }

      case ix::WebSocketMessageType::Close: {
        std::cout << "[Riptide] Client disconnected: " << state->getId() << std::endl;
        broadcaster_.unregister_subscriber(state->getId());
        break;
      }

      case ix::WebSocketMessageType::Error: {
        std::cerr << "[Riptide] Client error: " << msg->errorInfo.reason << std::endl;
        broadcaster_.unregister_subscriber(state->getId());
        break;
      }

      case ix::WebSocketMessageType::Message: {
        if (auto reply = liveness_reply(msg->str)) {
          ws.send(*reply);
        }
        break;
      }

      default:
        break;
    }
  }

  std::shared_ptr<ix::WebSocket> find_client(const ix::WebSocket& ws) {
    for (const auto& client : server_.getClients()) {
      if (client.get() == &ws) return client;
    }
    return nullptr;
  }

  uint16_t port_;
  std::string host_;
  Broadcaster& broadcaster_;
  ix::WebSocketServer server_;
  std::atomic<bool> running_{false};
};

}
