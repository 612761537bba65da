#include "LogAuditSink.hpp"

namespace wt {
void LogAuditSink::record(const AuditRecord& record) {
  CLOG(INFO, "audit") << record.action() << " target=" << record.target()
                      << " user=\"" << record.user() << "\""
                      << " time=" << record.event_time()
                      << (record.detail().empty() ? "" : " detail=\"")
                      << record.detail()
                      << (record.detail().empty() ? "" : "\"");
}

void recordAuditEvent(shared_ptr<AuditSink> sink, const string& action,
                      const TargetRef& target, const string& user,
                      const string& detail) {
  if (!sink) {
    return;
  }
  AuditRecord record;
  *record.mutable_target() = target;
  record.set_user(user);
  record.set_action(action);
  record.set_detail(detail);
  record.set_event_time(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  try {
    sink->record(record);
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Audit record '" << action << "' for " << target
                 << " dropped: " << ex.what();
  }
}
}  // namespace wt
