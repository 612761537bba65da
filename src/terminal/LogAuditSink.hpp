#ifndef __WT_LOG_AUDIT_SINK__
#define __WT_LOG_AUDIT_SINK__

#include "Headers.hpp"
#include "RemoteExec.hpp"

namespace wt {
/**
 * @brief Writes audit records to the "audit" easylogging++ logger.
 */
class LogAuditSink : public AuditSink {
 public:
  virtual ~LogAuditSink() {}

  virtual void record(const AuditRecord& record);
};

/**
 * @brief Records an event and swallows any failure, so auditing can never
 * affect the session.
 */
void recordAuditEvent(shared_ptr<AuditSink> sink, const string& action,
                      const TargetRef& target, const string& user,
                      const string& detail = "");
}  // namespace wt

#endif  // __WT_LOG_AUDIT_SINK__
