#ifndef __WT_WEB_TERMINAL_SERVER__
#define __WT_WEB_TERMINAL_SERVER__

#include "Clock.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "RemoteExec.hpp"
#include "SessionRegistry.hpp"
#include "TargetExistenceCache.hpp"
#include "TerminalBridge.hpp"
#include "UploadInjector.hpp"
#include "UrlUtils.hpp"
#include "WebSocketConnection.hpp"

namespace wt {
/**
 * @brief HTTP and WebSocket front door for browser terminals.
 *
 * One listening socket; every accepted connection gets its own thread, which
 * serves a single request (or a single WebSocket) and exits.
 */
class WebTerminalServer {
 public:
  /** @brief True when the cluster can be reached. */
  typedef function<bool()> HealthProbe;

  WebTerminalServer(const SocketEndpoint& _serverEndpoint,
                    shared_ptr<RemoteExecutor> _executor,
                    shared_ptr<TargetExistenceCache> _existenceCache,
                    shared_ptr<UploadInjector> _uploadInjector,
                    shared_ptr<AuditSink> _auditSink,
                    shared_ptr<SessionRegistry> _registry,
                    shared_ptr<Clock> _clock,
                    const BridgeConfig& _bridgeConfig,
                    int64_t _uploadMaxSize);

  virtual ~WebTerminalServer();

  /** @brief Accepts connections until close() is called. */
  void run();

  /** @brief Stops accepting and ends every live WebSocket. */
  void close();

  /** @brief The port actually bound (useful when asked for port 0). */
  int getPort() const { return port; }

  void setHealthProbe(HealthProbe probe) { healthProbe = probe; }

  /** @brief Body of GET /health. */
  json healthReport();

 protected:
  struct ConnectionThread {
    shared_ptr<thread> t;
    shared_ptr<std::atomic<bool>> done;
  };

  void handleConnection(shared_ptr<asio::io_context> ioContext,
                        tcp::socket socket);

  void handleWebSocket(shared_ptr<asio::io_context> ioContext,
                       tcp::socket& socket,
                       const http::request<http::empty_body>& request,
                       const vector<string>& segments,
                       const map<string, string>& query);

  void handleUpload(tcp::socket& socket, beast::flat_buffer& buffer,
                    http::request_parser<http::empty_body>& headerParser,
                    const vector<string>& segments,
                    const map<string, string>& query);

  void handleConnect(tcp::socket& socket,
                     const http::request<http::empty_body>& request,
                     const map<string, string>& query);

  void sendJson(tcp::socket& socket, unsigned version, http::status status,
                const json& body);

  /** @brief Joins connection threads that have finished. */
  void pruneThreads(bool all);

  static string userFromQuery(const map<string, string>& query);

  SocketEndpoint serverEndpoint;
  shared_ptr<RemoteExecutor> executor;
  shared_ptr<TargetExistenceCache> existenceCache;
  shared_ptr<UploadInjector> uploadInjector;
  shared_ptr<AuditSink> auditSink;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<Clock> clock;
  BridgeConfig bridgeConfig;
  int64_t uploadMaxSize;
  HealthProbe healthProbe;

  asio::io_context acceptContext;
  tcp::acceptor acceptor;
  int port;

  std::mutex serverMutex;
  bool halt;
  vector<ConnectionThread> connectionThreads;
  vector<weak_ptr<WebSocketConnection>> liveSockets;
};
}  // namespace wt

#endif  // __WT_WEB_TERMINAL_SERVER__
