#ifndef __WT_WEB_SOCKET_CONNECTION__
#define __WT_WEB_SOCKET_CONNECTION__

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "Headers.hpp"
#include "SessionErrors.hpp"

namespace wt {
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

// WebSocket close codes used by the bridge.
const int WS_CLOSE_NORMAL = 1000;
const int WS_CLOSE_ABNORMAL = 1011;
const int WS_CLOSE_PERMISSION_DENIED = 4403;
const int WS_CLOSE_TARGET_UNREACHABLE = 4404;

/**
 * @brief A WebSocket that many threads can read from, write to and close.
 *
 * Each connection owns an io_context driven by its own thread.  Inbound
 * messages are queued as they arrive; writes are handed to the io thread and
 * block until they hit the socket.
 */
class WebSocketConnection {
 public:
  struct Message {
    string payload;
    /** @brief True for text frames, false for binary frames. */
    bool text = false;
  };

  enum class ReadResult {
    MESSAGE,
    TIMEOUT,
    /** @brief The peer completed the closing handshake. */
    CLOSED
  };

  /**
   * @brief Dials `endpoint` and upgrades `target` to a WebSocket.
   *
   * @throws TargetUnreachable if the host refuses the connection or answers
   * the upgrade with 404.
   * @throws PermissionDenied if the upgrade is answered with 401 or 403.
   * @throws TransportBroken for anything else.
   */
  static shared_ptr<WebSocketConnection> connect(
      const SocketEndpoint& endpoint, const string& target);

  /**
   * @brief Completes a server-side upgrade.  `socket` must belong to
   * `ioContext` and `request` must already have been read from it.
   */
  static shared_ptr<WebSocketConnection> accept(
      shared_ptr<asio::io_context> ioContext, tcp::socket&& socket,
      const http::request<http::empty_body>& request);

  virtual ~WebSocketConnection();

  /**
   * @brief Waits up to `timeoutMs` for the next message.  Queued messages are
   * still delivered after the peer closed.
   * @throws TransportBroken when the socket failed.
   */
  ReadResult read(Message* message, int timeoutMs);

  /**
   * @brief Sends one frame and waits until it was written.
   * @throws TransportBroken
   */
  void write(const string& payload, bool text = false);

  /**
   * @brief Starts the closing handshake once pending writes are out, then
   * waits briefly for the peer to answer.  Idempotent.
   */
  void close(int code, const string& reason = "");

  /** @brief Stops the io thread and drops the socket. */
  void shutdown();

  /** @brief The code the peer closed with, or 0 if it has not. */
  int getCloseCode();

  string getCloseReason();

  bool isOpen();

  const string& getId() const { return id; }

 protected:
  struct PendingWrite {
    string payload;
    bool text;
    std::promise<beast::error_code> done;
  };

  WebSocketConnection(shared_ptr<asio::io_context> _ioContext,
                      tcp::socket&& socket, beast::role_type role);

  void start();

  void doRead();

  void doWrite();

  void doClose();

  void readEnded(const beast::error_code& ec);

  // Declared before the stream so it outlives it.
  shared_ptr<asio::io_context> ioContext;
  websocket::stream<tcp::socket> ws;
  string id;
  beast::flat_buffer readBuffer;
  shared_ptr<asio::executor_work_guard<asio::io_context::executor_type>>
      workGuard;
  shared_ptr<thread> ioThread;

  std::mutex connectionMutex;
  std::condition_variable connectionCv;
  deque<Message> inbox;
  bool peerClosed;
  bool broken;
  string brokenReason;
  int closeCode;
  string closeReason;
  bool closeStarted;
  bool stopped;

  // Only touched on the io thread.
  deque<shared_ptr<PendingWrite>> writeQueue;
  bool writing;
  bool closePending;
  websocket::close_reason pendingClose;
};
}  // namespace wt

#endif  // __WT_WEB_SOCKET_CONNECTION__
