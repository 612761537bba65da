#include "WebSocketConnection.hpp"

namespace wt {
namespace {
// The close frame payload is capped at 125 bytes, two of them the code.
const size_t MAX_CLOSE_REASON = 123;
const int CLOSE_HANDSHAKE_WAIT_MS = 3000;
}  // namespace

WebSocketConnection::WebSocketConnection(
    shared_ptr<asio::io_context> _ioContext, tcp::socket&& socket,
    beast::role_type role)
    : ioContext(_ioContext),
      ws(std::move(socket)),
      id(genRandomAlphaNum(8)),
      peerClosed(false),
      broken(false),
      closeCode(0),
      closeStarted(false),
      stopped(false),
      writing(false),
      closePending(false) {
  ws.set_option(websocket::stream_base::timeout::suggested(role));
  ws.binary(true);
}

WebSocketConnection::~WebSocketConnection() { shutdown(); }

shared_ptr<WebSocketConnection> WebSocketConnection::connect(
    const SocketEndpoint& endpoint, const string& target) {
  auto ioContext = make_shared<asio::io_context>();
  beast::error_code ec;
  tcp::resolver resolver(*ioContext);
  auto results =
      resolver.resolve(endpoint.name(), to_string(endpoint.port()), ec);
  if (ec) {
    throw TargetUnreachable("Could not resolve " + endpoint.name() + ": " +
                            ec.message());
  }

  shared_ptr<WebSocketConnection> connection(new WebSocketConnection(
      ioContext, tcp::socket(*ioContext), beast::role_type::client));
  asio::connect(connection->ws.next_layer(), results, ec);
  if (ec) {
    throw TargetUnreachable("Could not connect to " + endpoint.name() + ":" +
                            to_string(endpoint.port()) + ": " + ec.message());
  }

  connection->ws.set_option(
      websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(http::field::user_agent, string("wt/") + WT_VERSION);
      }));
  websocket::response_type response;
  string host = endpoint.name() + ":" + to_string(endpoint.port());
  connection->ws.handshake(response, host, target, ec);
  if (ec == websocket::error::upgrade_declined) {
    int status = response.result_int();
    string reason = "Upgrade declined with status " + to_string(status);
    if (!response.body().empty()) {
      reason += ": " + response.body();
    }
    if (status == 401 || status == 403) {
      throw PermissionDenied(reason);
    }
    if (status == 404) {
      throw TargetUnreachable(reason);
    }
    throw TransportBroken(reason);
  }
  if (ec) {
    throw TransportBroken("WebSocket handshake failed: " + ec.message());
  }
  LOG(INFO) << "WebSocket " << connection->id << " connected to " << host
            << target;
  connection->start();
  return connection;
}

shared_ptr<WebSocketConnection> WebSocketConnection::accept(
    shared_ptr<asio::io_context> ioContext, tcp::socket&& socket,
    const http::request<http::empty_body>& request) {
  shared_ptr<WebSocketConnection> connection(new WebSocketConnection(
      ioContext, std::move(socket), beast::role_type::server));
  connection->ws.set_option(
      websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, string("wtserver/") + WT_VERSION);
      }));
  beast::error_code ec;
  connection->ws.accept(request, ec);
  if (ec) {
    throw TransportBroken("WebSocket upgrade failed: " + ec.message());
  }
  connection->start();
  return connection;
}

void WebSocketConnection::start() {
  workGuard.reset(new asio::executor_work_guard<asio::io_context::executor_type>(
      ioContext->get_executor()));
  asio::post(*ioContext, [this] { doRead(); });
  ioThread.reset(new thread([this] {
    el::Helpers::setThreadName("WebSocket-" + id);
    ioContext->run();
  }));
}

void WebSocketConnection::doRead() {
  ws.async_read(readBuffer, [this](beast::error_code ec, size_t) {
    if (ec) {
      readEnded(ec);
      return;
    }
    Message message;
    message.payload = beast::buffers_to_string(readBuffer.data());
    message.text = ws.got_text();
    readBuffer.consume(readBuffer.size());
    {
      lock_guard<std::mutex> guard(connectionMutex);
      inbox.push_back(std::move(message));
      connectionCv.notify_all();
    }
    doRead();
  });
}

void WebSocketConnection::readEnded(const beast::error_code& ec) {
  lock_guard<std::mutex> guard(connectionMutex);
  if (ec == websocket::error::closed) {
    peerClosed = true;
    closeCode = ws.reason().code;
    closeReason =
        string(ws.reason().reason.data(), ws.reason().reason.size());
    LOG(INFO) << "WebSocket " << id << " closed by peer with code "
              << closeCode;
  } else {
    broken = true;
    brokenReason = ec.message();
    LOG(INFO) << "WebSocket " << id << " read failed: " << brokenReason;
  }
  connectionCv.notify_all();
}

WebSocketConnection::ReadResult WebSocketConnection::read(Message* message,
                                                          int timeoutMs) {
  std::unique_lock<std::mutex> lock(connectionMutex);
  connectionCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
    return !inbox.empty() || peerClosed || broken || stopped;
  });
  if (!inbox.empty()) {
    *message = std::move(inbox.front());
    inbox.pop_front();
    return ReadResult::MESSAGE;
  }
  if (broken) {
    throw TransportBroken("WebSocket failed: " + brokenReason);
  }
  if (peerClosed || stopped) {
    return ReadResult::CLOSED;
  }
  return ReadResult::TIMEOUT;
}

void WebSocketConnection::write(const string& payload, bool text) {
  {
    lock_guard<std::mutex> guard(connectionMutex);
    if (stopped || broken || closeStarted) {
      throw TransportBroken("Write on a closed WebSocket");
    }
  }
  auto pending = make_shared<PendingWrite>();
  pending->payload = payload;
  pending->text = text;
  auto done = pending->done.get_future();
  asio::post(*ioContext, [this, pending] {
    if (closePending) {
      pending->done.set_value(asio::error::operation_aborted);
      return;
    }
    writeQueue.push_back(pending);
    if (!writing) {
      doWrite();
    }
  });

  while (done.wait_for(std::chrono::milliseconds(100)) !=
         std::future_status::ready) {
    lock_guard<std::mutex> guard(connectionMutex);
    if (stopped) {
      throw TransportBroken("WebSocket shut down during write");
    }
  }
  beast::error_code ec;
  try {
    ec = done.get();
  } catch (const std::future_error& fe) {
    throw TransportBroken(string("WebSocket write abandoned: ") + fe.what());
  }
  if (ec) {
    throw TransportBroken("WebSocket write failed: " + ec.message());
  }
}

void WebSocketConnection::doWrite() {
  writing = true;
  auto pending = writeQueue.front();
  ws.text(pending->text);
  ws.async_write(asio::buffer(pending->payload),
                 [this](beast::error_code ec, size_t) {
                   auto finished = writeQueue.front();
                   writeQueue.pop_front();
                   finished->done.set_value(ec);
                   if (!writeQueue.empty()) {
                     doWrite();
                     return;
                   }
                   writing = false;
                   if (closePending) {
                     doClose();
                   }
                 });
}

void WebSocketConnection::close(int code, const string& reason) {
  {
    lock_guard<std::mutex> guard(connectionMutex);
    if (closeStarted || stopped || !ioThread) {
      return;
    }
    closeStarted = true;
    if (peerClosed || broken) {
      return;
    }
  }
  string truncated = reason.substr(0, MAX_CLOSE_REASON);
  websocket::close_reason closeFrame(static_cast<websocket::close_code>(code),
                                     beast::string_view(truncated));
  asio::post(*ioContext, [this, closeFrame] {
    closePending = true;
    pendingClose = closeFrame;
    if (!writing) {
      doClose();
    }
  });

  std::unique_lock<std::mutex> lock(connectionMutex);
  if (!connectionCv.wait_for(
          lock, std::chrono::milliseconds(CLOSE_HANDSHAKE_WAIT_MS),
          [this] { return peerClosed || broken || stopped; })) {
    LOG(WARNING) << "WebSocket " << id
                 << " peer did not answer the close handshake";
  }
}

void WebSocketConnection::doClose() {
  VLOG(1) << "WebSocket " << id << " closing with code " << pendingClose.code;
  ws.async_close(pendingClose, [this](beast::error_code ec) {
    if (ec) {
      VLOG(1) << "WebSocket " << id << " close failed: " << ec.message();
      readEnded(ec);
    }
  });
}

void WebSocketConnection::shutdown() {
  {
    lock_guard<std::mutex> guard(connectionMutex);
    if (stopped) {
      return;
    }
    stopped = true;
    connectionCv.notify_all();
  }
  workGuard.reset();
  ioContext->stop();
  if (ioThread && ioThread->joinable()) {
    if (ioThread->get_id() == std::this_thread::get_id()) {
      ioThread->detach();
    } else {
      ioThread->join();
    }
  }
  beast::error_code ec;
  beast::get_lowest_layer(ws).shutdown(tcp::socket::shutdown_both, ec);
  beast::get_lowest_layer(ws).close(ec);
}

int WebSocketConnection::getCloseCode() {
  lock_guard<std::mutex> guard(connectionMutex);
  return closeCode;
}

string WebSocketConnection::getCloseReason() {
  lock_guard<std::mutex> guard(connectionMutex);
  return closeReason;
}

bool WebSocketConnection::isOpen() {
  lock_guard<std::mutex> guard(connectionMutex);
  return !(peerClosed || broken || stopped);
}
}  // namespace wt
