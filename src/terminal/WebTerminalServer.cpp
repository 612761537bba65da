#include "WebTerminalServer.hpp"

#include "LogAuditSink.hpp"

namespace wt {
namespace {
const string API_PREFIX = "/api/v1";
const string DEFAULT_USER = "unknown_user";
const int REQUEST_HEADER_WAIT_MS = 30 * 1000;
}  // namespace

WebTerminalServer::WebTerminalServer(
    const SocketEndpoint& _serverEndpoint,
    shared_ptr<RemoteExecutor> _executor,
    shared_ptr<TargetExistenceCache> _existenceCache,
    shared_ptr<UploadInjector> _uploadInjector,
    shared_ptr<AuditSink> _auditSink, shared_ptr<SessionRegistry> _registry,
    shared_ptr<Clock> _clock, const BridgeConfig& _bridgeConfig,
    int64_t _uploadMaxSize)
    : serverEndpoint(_serverEndpoint),
      executor(_executor),
      existenceCache(_existenceCache),
      uploadInjector(_uploadInjector),
      auditSink(_auditSink),
      registry(_registry),
      clock(_clock),
      bridgeConfig(_bridgeConfig),
      uploadMaxSize(_uploadMaxSize),
      acceptor(acceptContext),
      port(0),
      halt(false) {
  beast::error_code ec;
  auto address = asio::ip::make_address(
      serverEndpoint.has_name() ? serverEndpoint.name() : "0.0.0.0", ec);
  if (ec) {
    throw std::runtime_error("Invalid bind address " + serverEndpoint.name() +
                             ": " + ec.message());
  }
  tcp::endpoint endpoint(address, serverEndpoint.port());
  acceptor.open(endpoint.protocol(), ec);
  if (!ec) acceptor.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec) acceptor.bind(endpoint, ec);
  if (!ec) acceptor.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("Could not listen on " +
                             endpoint.address().to_string() + ":" +
                             to_string(endpoint.port()) + ": " + ec.message());
  }
  acceptor.non_blocking(true, ec);
  port = acceptor.local_endpoint().port();
  LOG(INFO) << "Listening on " << endpoint.address().to_string() << ":"
            << port;
}

WebTerminalServer::~WebTerminalServer() {
  close();
  pruneThreads(true);
  beast::error_code ec;
  acceptor.close(ec);
}

void WebTerminalServer::run() {
  LOG(INFO) << "Creating server";
  while (true) {
    {
      lock_guard<std::mutex> guard(serverMutex);
      if (halt) {
        break;
      }
    }
    pruneThreads(false);
    if (!waitOnSocketData(acceptor.native_handle(), 10)) {
      continue;
    }
    auto ioContext = make_shared<asio::io_context>();
    tcp::socket socket(*ioContext);
    beast::error_code ec;
    acceptor.accept(socket, ec);
    if (ec) {
      if (ec != asio::error::would_block && ec != asio::error::try_again) {
        LOG(WARNING) << "Accept failed: " << ec.message();
      }
      continue;
    }
    socket.non_blocking(false, ec);
    VLOG(1) << "Accepted connection from "
            << socket.remote_endpoint(ec).address().to_string();

    ConnectionThread connectionThread;
    connectionThread.done.reset(new std::atomic<bool>(false));
    auto done = connectionThread.done;
    auto sharedSocket = make_shared<tcp::socket>(std::move(socket));
    connectionThread.t.reset(new thread([this, ioContext, sharedSocket, done] {
      try {
        handleConnection(ioContext, std::move(*sharedSocket));
      } catch (const std::runtime_error& re) {
        LOG(ERROR) << "Connection handler failed: " << re.what();
      }
      *done = true;
    }));
    lock_guard<std::mutex> guard(serverMutex);
    connectionThreads.push_back(connectionThread);
  }
  beast::error_code ec;
  acceptor.close(ec);
  pruneThreads(true);
  LOG(INFO) << "Server stopped";
}

void WebTerminalServer::close() {
  vector<shared_ptr<WebSocketConnection>> sockets;
  {
    lock_guard<std::mutex> guard(serverMutex);
    if (halt) {
      return;
    }
    halt = true;
    for (auto& weakSocket : liveSockets) {
      auto socket = weakSocket.lock();
      if (socket) {
        sockets.push_back(socket);
      }
    }
    liveSockets.clear();
  }
  for (auto socket : sockets) {
    socket->close(WS_CLOSE_NORMAL, "Server shutting down");
  }
}

void WebTerminalServer::pruneThreads(bool all) {
  vector<ConnectionThread> finished;
  {
    lock_guard<std::mutex> guard(serverMutex);
    for (auto it = connectionThreads.begin(); it != connectionThreads.end();) {
      if (all || *(it->done)) {
        finished.push_back(*it);
        it = connectionThreads.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& connectionThread : finished) {
    connectionThread.t->join();
  }
}

string WebTerminalServer::userFromQuery(const map<string, string>& query) {
  auto it = query.find("chinesename");
  if (it == query.end() || it->second.empty()) {
    return DEFAULT_USER;
  }
  return it->second;
}

json WebTerminalServer::healthReport() {
  bool clusterReachable = healthProbe ? healthProbe() : true;
  json report;
  report["status"] = clusterReachable ? "healthy" : "degraded";
  report["kubernetes"] = clusterReachable ? "connected" : "disconnected";
  report["active_sessions"] = registry->size();
  report["timestamp"] = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
  return report;
}

void WebTerminalServer::handleConnection(
    shared_ptr<asio::io_context> ioContext, tcp::socket socket) {
  el::Helpers::setThreadName("Connection-" + genRandomAlphaNum(4));
  if (!waitOnSocketData(socket.native_handle(), REQUEST_HEADER_WAIT_MS)) {
    LOG(INFO) << "Client sent no request, dropping connection";
    return;
  }

  beast::flat_buffer buffer;
  http::request_parser<http::empty_body> headerParser;
  beast::error_code ec;
  http::read_header(socket, buffer, headerParser, ec);
  if (ec) {
    LOG(INFO) << "Could not read request: " << ec.message();
    return;
  }
  const auto& request = headerParser.get();
  UrlUtils::ParsedTarget parsed =
      UrlUtils::parseTarget(string(request.target()));
  vector<string> segments =
      UrlUtils::pathSegments(UrlUtils::stripPrefix(parsed.path, API_PREFIX));
  VLOG(1) << request.method_string() << " " << parsed.path;

  if (websocket::is_upgrade(request)) {
    if (segments.size() == 3 && segments[0] == "ws") {
      handleWebSocket(ioContext, socket, request, segments, parsed.query);
    } else {
      sendJson(socket, request.version(), http::status::not_found,
               {{"error", "No WebSocket endpoint at " + parsed.path}});
    }
    return;
  }

  if (request.method() == http::verb::post && segments.size() == 3 &&
      segments[0] == "upload") {
    handleUpload(socket, buffer, headerParser, segments, parsed.query);
    return;
  }

  if (request.method() != http::verb::get) {
    sendJson(socket, request.version(), http::status::method_not_allowed,
             {{"error", "Method not allowed"}});
    return;
  }

  if (segments.empty()) {
    json info;
    info["success"] = true;
    info["message"] = "WebTerminal bridge is running";
    info["data"] = {{"version", WT_VERSION},
                    {"endpoints",
                     {"/connect", "/ws/{namespace}/{podname}",
                      "/upload/{namespace}/{podname}", "/health",
                      "/version"}}};
    sendJson(socket, request.version(), http::status::ok, info);
  } else if (segments.size() == 1 && segments[0] == "version") {
    sendJson(socket, request.version(), http::status::ok,
             {{"version", WT_VERSION}});
  } else if (segments.size() == 1 && segments[0] == "health") {
    sendJson(socket, request.version(), http::status::ok, healthReport());
  } else if (segments.size() == 1 && segments[0] == "connect") {
    handleConnect(socket, request, parsed.query);
  } else {
    sendJson(socket, request.version(), http::status::not_found,
             {{"error", "Not found"}});
  }
}

void WebTerminalServer::handleConnect(
    tcp::socket& socket, const http::request<http::empty_body>& request,
    const map<string, string>& query) {
  auto ns = query.find("namespace");
  auto pod = query.find("podname");
  if (ns == query.end() || pod == query.end() || ns->second.empty() ||
      pod->second.empty()) {
    sendJson(socket, request.version(), http::status::bad_request,
             {{"error", "namespace and podname are required"}});
    return;
  }
  TargetRef target = makeTargetRef(ns->second, pod->second);
  LOG(INFO) << "Connect request from '" << userFromQuery(query) << "' for "
            << target;
  if (existenceCache && !existenceCache->exists(target)) {
    sendJson(socket, request.version(), http::status::not_found,
             {{"error", "Pod '" + target.name() + "' does not exist in namespace '" +
                            target.ns() + "'"}});
    return;
  }
  string websocketPath = "/ws/" + UrlUtils::encode(target.ns()) + "/" +
                         UrlUtils::encode(target.name());
  if (query.count("chinesename")) {
    websocketPath +=
        "?chinesename=" + UrlUtils::encode(query.find("chinesename")->second);
  }
  sendJson(socket, request.version(), http::status::ok,
           {{"namespace", target.ns()},
            {"podname", target.name()},
            {"websocket", websocketPath}});
}

void WebTerminalServer::handleWebSocket(
    shared_ptr<asio::io_context> ioContext, tcp::socket& socket,
    const http::request<http::empty_body>& request,
    const vector<string>& segments, const map<string, string>& query) {
  TargetRef target = makeTargetRef(segments[1], segments[2]);
  string user = userFromQuery(query);
  if (existenceCache && !existenceCache->exists(target)) {
    LOG(INFO) << "Refusing WebSocket for missing target " << target;
    sendJson(socket, request.version(), http::status::not_found,
             {{"error", "Pod '" + target.name() + "' does not exist in namespace '" +
                            target.ns() + "'"}});
    return;
  }

  TerminalGeometry geometry = makeGeometry(UrlUtils::queryInt(query, "cols", 80),
                                           UrlUtils::queryInt(query, "rows", 24));
  if (!isValidGeometry(geometry)) {
    geometry = makeGeometry(80, 24);
  }

  shared_ptr<WebSocketConnection> connection;
  try {
    connection =
        WebSocketConnection::accept(ioContext, std::move(socket), request);
  } catch (const TransportBroken& tb) {
    LOG(WARNING) << tb.what();
    return;
  }
  {
    lock_guard<std::mutex> guard(serverMutex);
    if (halt) {
      connection->close(WS_CLOSE_NORMAL, "Server shutting down");
      connection->shutdown();
      return;
    }
    liveSockets.erase(
        std::remove_if(liveSockets.begin(), liveSockets.end(),
                       [](const weak_ptr<WebSocketConnection>& s) {
                         return s.expired();
                       }),
        liveSockets.end());
    liveSockets.push_back(connection);
  }
  LOG(INFO) << "Terminal WebSocket " << connection->getId() << " for '" << user
            << "' on " << target;
  TerminalBridge bridge(connection, executor, auditSink, registry, clock,
                        bridgeConfig, target, user);
  bridge.run(geometry);
}

void WebTerminalServer::handleUpload(
    tcp::socket& socket, beast::flat_buffer& buffer,
    http::request_parser<http::empty_body>& headerParser,
    const vector<string>& segments, const map<string, string>& query) {
  unsigned version = headerParser.get().version();
  TargetRef target = makeTargetRef(segments[1], segments[2]);
  string user = userFromQuery(query);
  auto fileNameIt = query.find("filename");
  string fileName = fileNameIt == query.end() ? "" : fileNameIt->second;
  try {
    UploadInjector::sanitizeFileName(fileName);
  } catch (const UploadValidationFailed& uvf) {
    sendJson(socket, version, http::status::bad_request,
             {{"error", uvf.what()}});
    return;
  }
  if (existenceCache && !existenceCache->exists(target)) {
    sendJson(socket, version, http::status::not_found,
             {{"error", "Pod '" + target.name() + "' does not exist in namespace '" +
                            target.ns() + "'"}});
    return;
  }

  beast::error_code ec;
  if (beast::iequals(headerParser.get()[http::field::expect], "100-continue")) {
    http::response<http::empty_body> proceed{http::status::continue_, version};
    http::write(socket, proceed, ec);
  }

  string tempPath = GetTempDirectory() + "wtserver-upload-" + genRandomAlphaNum(12);
  http::request_parser<http::file_body> bodyParser(std::move(headerParser));
  bodyParser.body_limit(uploadMaxSize);
  bodyParser.get().body().open(tempPath.c_str(), beast::file_mode::write, ec);
  if (ec) {
    LOG(ERROR) << "Cannot create " << tempPath << ": " << ec.message();
    sendJson(socket, version, http::status::internal_server_error,
             {{"error", "Cannot stage upload"}});
    return;
  }
  http::read(socket, buffer, bodyParser, ec);
  bodyParser.get().body().close();
  if (ec) {
    std::error_code removeError;
    fs::remove(tempPath, removeError);
    if (ec == http::error::body_limit) {
      sendJson(socket, version, http::status::payload_too_large,
               {{"error", "File exceeds the " + to_string(uploadMaxSize) +
                              " byte limit"}});
    } else {
      LOG(INFO) << "Upload body from '" << user << "' broke: " << ec.message();
    }
    return;
  }

  LOG(INFO) << "Upload of '" << fileName << "' from '" << user << "' to "
            << target;
  UploadResult result;
  try {
    auto task = uploadInjector->upload(target, user, fileName,
                                       make_shared<FileByteSource>(tempPath));
    result = task->getResult();
  } catch (const std::runtime_error& re) {
    result.kind = UploadResult::TRANSPORT_FAILED;
    result.reason = re.what();
  }
  std::error_code removeError;
  fs::remove(tempPath, removeError);

  recordAuditEvent(auditSink, "upload", target, user,
                   "file=" + fileName + (result.succeeded()
                                             ? " path=" + result.path
                                             : " error=" + result.reason));
  switch (result.kind) {
    case UploadResult::SUCCESS:
      sendJson(socket, version, http::status::ok,
               {{"message", result.path}, {"path", result.path}});
      break;
    case UploadResult::VALIDATION_FAILED:
      sendJson(socket, version, http::status::bad_request,
               {{"error", result.reason}});
      break;
    default:
      sendJson(socket, version, http::status::internal_server_error,
               {{"error", result.reason}});
      break;
  }
}

void WebTerminalServer::sendJson(tcp::socket& socket, unsigned version,
                                 http::status status, const json& body) {
  http::response<http::string_body> response{status, version};
  response.set(http::field::server, string("wtserver/") + WT_VERSION);
  response.set(http::field::content_type, "application/json");
  response.keep_alive(false);
  response.body() = body.dump();
  response.prepare_payload();
  beast::error_code ec;
  http::write(socket, response, ec);
  if (ec) {
    VLOG(1) << "Could not send response: " << ec.message();
  }
  socket.shutdown(tcp::socket::shutdown_send, ec);
}
}  // namespace wt
