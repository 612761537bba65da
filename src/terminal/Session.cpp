#include "Session.hpp"

namespace wt {
Session::Session(shared_ptr<RemoteExecutor> _executor,
                 const TargetRef& _target, const string& _userIdentity,
                 shared_ptr<TerminalSink> _sink, const SessionConfig& _config,
                 shared_ptr<Clock> _clock)
    : executor(_executor),
      target(_target),
      userIdentity(_userIdentity),
      id(genRandomAlphaNum(8)),
      sink(_sink),
      config(_config),
      clock(_clock),
      splitter(_config.chunking),
      state(SessionState::CONNECTING),
      closeReason(CloseReason::NORMAL),
      resizeRequestedBeforeOpen(false),
      waitingOnHeartbeat(false),
      runningPumps(0) {
  geometry = makeGeometry(80, 24);
  lastActivity = clock->now();
}

Session::~Session() {
  close(CloseReason::NORMAL, "Session destroyed");
  for (auto pump : {inboundThread, outboundThread}) {
    if (!pump || !pump->joinable()) {
      continue;
    }
    if (pump->get_id() == std::this_thread::get_id()) {
      // Destroyed from our own close callback.  The pump touches nothing
      // after the callback returns.
      pump->detach();
    } else {
      pump->join();
    }
  }
}

void Session::setCloseCallback(CloseCallback callback) {
  lock_guard<std::mutex> guard(sessionMutex);
  closeCallback = callback;
}

void Session::open(const TerminalGeometry& initialGeometry) {
  TerminalGeometry openGeometry;
  {
    lock_guard<std::mutex> guard(sessionMutex);
    if (state != SessionState::CONNECTING) {
      throw std::runtime_error(string("Cannot open a session in state ") +
                               sessionStateName(state));
    }
    if (!resizeRequestedBeforeOpen) {
      if (!isValidGeometry(initialGeometry)) {
        throw std::runtime_error("Invalid initial geometry");
      }
      geometry = initialGeometry;
    }
    openGeometry = geometry;
  }

  LOG(INFO) << "Session " << id << " attaching to " << target << " for '"
            << userIdentity << "' at " << openGeometry;
  shared_ptr<RemoteTransport> newTransport;
  try {
    newTransport = executor->attach(target, openGeometry);
    // The remote side always learns the geometry before any data flows.
    newTransport->resize(openGeometry);
  } catch (const std::runtime_error& ex) {
    LOG(WARNING) << "Session " << id << " failed to open: " << ex.what();
    if (newTransport) {
      newTransport->close();
    }
    lock_guard<std::mutex> guard(sessionMutex);
    closeReason = CloseReason::ABNORMAL;
    closeDetail = ex.what();
    state = SessionState::CLOSED;
    sessionCv.notify_all();
    throw;
  }

  lock_guard<std::mutex> guard(sessionMutex);
  if (state != SessionState::CONNECTING) {
    // close() raced with attach
    newTransport->close();
    throw TransportBroken("Session closed while opening");
  }
  transport = newTransport;
  state = SessionState::OPEN;
  if (!(geometry == openGeometry)) {
    // Resized while attaching.
    VLOG(1) << "Session " << id << " resized to " << geometry
            << " during attach";
    OutboundItem item;
    item.kind = OutboundItem::RESIZE;
    item.geometry = geometry;
    outbound.push_front(item);
  }
  lastActivity = clock->now();
  runningPumps = 2;
  inboundThread.reset(new thread(&Session::inboundLoop, this));
  outboundThread.reset(new thread(&Session::outboundLoop, this));
  LOG(INFO) << "Session " << id << " is open";
}

void Session::send(const string& bytes) {
  if (bytes.empty()) {
    return;
  }
  lock_guard<std::mutex> guard(sessionMutex);
  if (state != SessionState::OPEN) {
    LOG(WARNING) << "Dropping " << bytes.size() << " bytes sent while session "
                 << id << " is " << sessionStateName(state);
    return;
  }
  OutboundItem item;
  if (splitter.shouldSplit(bytes)) {
    item.kind = OutboundItem::TRANSFER;
    item.transfer = splitter.createTransfer(bytes);
  } else {
    item.kind = OutboundItem::DATA;
    item.data = bytes;
  }
  outbound.push_back(item);
  sessionCv.notify_all();
}

void Session::resize(const TerminalGeometry& newGeometry) {
  if (!isValidGeometry(newGeometry)) {
    LOG(WARNING) << "Ignoring invalid geometry " << newGeometry;
    return;
  }
  lock_guard<std::mutex> guard(sessionMutex);
  switch (state) {
    case SessionState::CONNECTING:
      geometry = newGeometry;
      resizeRequestedBeforeOpen = true;
      return;
    case SessionState::OPEN:
      break;
    default:
      LOG(WARNING) << "Ignoring resize on " << sessionStateName(state)
                   << " session " << id;
      return;
  }
  if (geometry == newGeometry) {
    VLOG(1) << "Geometry unchanged at " << newGeometry;
    return;
  }
  geometry = newGeometry;
  OutboundItem item;
  item.kind = OutboundItem::RESIZE;
  item.geometry = newGeometry;
  outbound.push_back(item);
  sessionCv.notify_all();
}

void Session::close(CloseReason reason, const string& detail) {
  CloseCallback callback;
  {
    lock_guard<std::mutex> guard(sessionMutex);
    if (state == SessionState::CLOSING || state == SessionState::CLOSED) {
      return;
    }
    if (state == SessionState::OPEN) {
      requestCloseLocked(reason, detail);
      return;
    }
    // CONNECTING: no pumps and no transport yet.
    closeReason = reason;
    closeDetail = detail;
    state = SessionState::CLOSED;
    callback = closeCallback;
    sessionCv.notify_all();
  }
  if (callback) {
    callback(reason, detail);
  }
}

void Session::requestCloseLocked(CloseReason reason, const string& detail) {
  if (state != SessionState::OPEN) {
    return;
  }
  LOG(INFO) << "Closing session " << id << " ("
            << (reason == CloseReason::NORMAL ? "normal" : "abnormal")
            << "): " << detail;
  closeReason = reason;
  closeDetail = detail;
  state = SessionState::CLOSING;
  sessionCv.notify_all();
}

bool Session::waitForClose(int timeoutMs) {
  std::unique_lock<std::mutex> lock(sessionMutex);
  return sessionCv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                            [this] { return state == SessionState::CLOSED; });
}

SessionState Session::getState() {
  lock_guard<std::mutex> guard(sessionMutex);
  return state;
}

CloseReason Session::getCloseReason() {
  lock_guard<std::mutex> guard(sessionMutex);
  return closeReason;
}

string Session::getCloseDetail() {
  lock_guard<std::mutex> guard(sessionMutex);
  return closeDetail;
}

TerminalGeometry Session::getGeometry() {
  lock_guard<std::mutex> guard(sessionMutex);
  return geometry;
}

Clock::TimePoint Session::getLastActivity() {
  lock_guard<std::mutex> guard(sessionMutex);
  return lastActivity;
}

void Session::markActivity() {
  lock_guard<std::mutex> guard(sessionMutex);
  lastActivity = clock->now();
  waitingOnHeartbeat = false;
}

void Session::inboundLoop() {
  el::Helpers::setThreadName("Inbound-" + id);
  while (true) {
    {
      lock_guard<std::mutex> guard(sessionMutex);
      if (state != SessionState::OPEN) {
        break;
      }
    }
    string payload;
    try {
      TransportReadResult result = transport->read(&payload, config.readTimeoutMs);
      if (result == TransportReadResult::TIMEOUT) {
        continue;
      }
      if (result == TransportReadResult::CLOSED) {
        close(CloseReason::NORMAL, "Remote side ended the session");
        break;
      }
      markActivity();
      if (ControlCodec::isHeartbeat(payload)) {
        VLOG(2) << "Got a heartbeat";
        continue;
      }
      VLOG(3) << "Forwarding " << payload.size() << " bytes to the terminal";
      sink->write(payload);
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Inbound pump for session " << id
                   << " failed: " << re.what();
      close(CloseReason::ABNORMAL, re.what());
      break;
    }
  }
  pumpFinished();
}

void Session::outboundLoop() {
  el::Helpers::setThreadName("Outbound-" + id);
  bool heartbeatEnabled = config.livenessTimeoutMs > 0;
  auto checkPeriod = std::chrono::milliseconds(
      heartbeatEnabled ? max(1, config.livenessTimeoutMs / 3) : 1000);
  auto nextLivenessCheck = clock->now() + checkPeriod;

  std::unique_lock<std::mutex> lock(sessionMutex);
  while (state == SessionState::OPEN) {
    if (heartbeatEnabled && clock->now() >= nextLivenessCheck) {
      nextLivenessCheck = clock->now() + checkPeriod;
      checkLivenessLocked();
      continue;
    }
    if (outbound.empty()) {
      sessionCv.wait_for(lock, checkPeriod);
      continue;
    }

    OutboundItem item = outbound.front();
    outbound.pop_front();
    lock.unlock();
    bool keepGoing = true;
    try {
      switch (item.kind) {
        case OutboundItem::DATA:
          VLOG(3) << "Writing " << item.data.size() << " bytes to remote";
          transport->write(item.data);
          break;
        case OutboundItem::RESIZE:
          LOG(INFO) << "Resizing remote terminal to " << item.geometry;
          transport->resize(item.geometry);
          break;
        case OutboundItem::TRANSFER:
          keepGoing = deliverTransfer(item.transfer);
          break;
      }
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Outbound pump for session " << id
                   << " failed: " << re.what();
      close(CloseReason::ABNORMAL, re.what());
      keepGoing = false;
    }
    lock.lock();
    if (!keepGoing) {
      break;
    }
  }
  lock.unlock();
  pumpFinished();
}

bool Session::deliverTransfer(shared_ptr<ChunkedTransfer> transfer) {
  while (transfer->hasNext()) {
    transport->write(transfer->next());
    if (!transfer->hasNext()) {
      break;
    }
    std::unique_lock<std::mutex> lock(sessionMutex);
    sessionCv.wait_for(lock, config.chunking.interFragmentDelay,
                       [this] { return state != SessionState::OPEN; });
    if (state != SessionState::OPEN) {
      LOG(INFO) << "Discarding transfer after " << transfer->sent() << "/"
                << transfer->size() << " fragments";
      return false;
    }
  }
  return true;
}

void Session::checkLivenessLocked() {
  auto now = clock->now();
  auto liveness = std::chrono::milliseconds(config.livenessTimeoutMs);
  if (now - lastActivity < liveness) {
    waitingOnHeartbeat = false;
    return;
  }
  if (waitingOnHeartbeat) {
    if (config.closeOnMissedHeartbeat && now - heartbeatSentAt >= liveness) {
      LOG(INFO) << "Missed a heartbeat, killing session " << id;
      requestCloseLocked(CloseReason::ABNORMAL, "Missed heartbeat");
    }
    return;
  }
  VLOG(1) << "Session " << id << " idle, sending heartbeat";
  OutboundItem item;
  item.kind = OutboundItem::DATA;
  item.data = ControlCodec::encodeHeartbeat();
  outbound.push_back(item);
  waitingOnHeartbeat = true;
  heartbeatSentAt = now;
}

void Session::pumpFinished() {
  {
    lock_guard<std::mutex> guard(sessionMutex);
    runningPumps--;
    if (runningPumps > 0) {
      return;
    }
  }

  // Last pump out releases the transport.
  transport->close();

  CloseCallback callback;
  CloseReason reason;
  string detail;
  {
    lock_guard<std::mutex> guard(sessionMutex);
    state = SessionState::CLOSED;
    outbound.clear();
    callback = closeCallback;
    reason = closeReason;
    detail = closeDetail;
    sessionCv.notify_all();
  }
  LOG(INFO) << "Session " << id << " closed";
  if (callback) {
    callback(reason, detail);
  }
}
}  // namespace wt
