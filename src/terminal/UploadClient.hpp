#ifndef __WT_UPLOAD_CLIENT__
#define __WT_UPLOAD_CLIENT__

#include "Headers.hpp"
#include "SessionErrors.hpp"

namespace wt {
/**
 * @brief Posts a local file to wtserver's upload route.
 */
class UploadClient {
 public:
  /** @brief Called with bytes sent so far and the file size. */
  typedef function<void(int64_t sent, int64_t total)> ProgressFn;

  UploadClient(const SocketEndpoint& _serverEndpoint,
               const string& _userIdentity)
      : serverEndpoint(_serverEndpoint), userIdentity(_userIdentity) {}

  /**
   * @brief Uploads `localPath` into the upload directory of `target`.
   * @return The server's answer, with status_code set.  A 4xx/5xx answer is
   * returned, not thrown.
   * @throws UploadValidationFailed if `localPath` cannot be read.
   * @throws UploadTransportFailed if the server cannot be reached.
   */
  UploadResponse upload(const TargetRef& target, const string& localPath,
                        ProgressFn progress = ProgressFn());

  /** @brief Request target for uploading `fileName` to `target`. */
  static string uploadPath(const TargetRef& target, const string& fileName,
                           const string& userIdentity);

  /** @brief Maps an HTTP status and JSON body to an UploadResponse. */
  static UploadResponse parseResponse(int status, const string& body);

 protected:
  SocketEndpoint serverEndpoint;
  string userIdentity;
};
}  // namespace wt

#endif  // __WT_UPLOAD_CLIENT__
