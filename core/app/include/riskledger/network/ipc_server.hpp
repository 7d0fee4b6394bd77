#pragma once

#include "riskledger/concurrent/thread_safe_queue.hpp"
#include "riskledger/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace riskledger {

// -----------------------------------------------------------------------------
// IpcServer — operator command socket plus telemetry broadcast
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving two ZeroMQ sockets:
//           REP  (default tcp://127.0.0.1:5556) — text commands in, JSON out.
//           PUB  (default tcp://127.0.0.1:5557) — JSON telemetry out.
//
// @details
// Commands are forwarded to command_handler_, which main() binds to
// ExecutionController::executeCommand. The handler runs on the IPC thread;
// everything it touches is guarded by the controller's own locks.
//
// Telemetry enters through pushTelemetry(), normally called from EventBus
// subscribers on whatever thread submitted the signal. The queue decouples
// that thread from JSON encoding and socket I/O. Events without a telemetry
// form (MarketDataEvent) are dropped on the IPC thread.
//
// Thread model:
//   start()/stop() from the owning thread. stop() joins the worker after a
//   final telemetry drain. pushTelemetry() is safe from any thread.
//
// Ownership:
//   Owns the zmq context, both sockets (created in start()), the queue and
//   the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  // zmq::error_t from bind() propagates to the caller.
  void start();

  // Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // Formats one event as the PUB payload. std::nullopt for events that are
  // not broadcast.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace riskledger
