#ifndef __WT_URL_UTILS__
#define __WT_URL_UTILS__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Request target parsing for the HTTP routes.
 */
class UrlUtils {
 public:
  struct ParsedTarget {
    string path;
    map<string, string> query;
  };

  /** @brief Splits "/a/b?x=1&y=2" into a decoded path and query map. */
  static ParsedTarget parseTarget(const string& target);

  /**
   * @brief Percent-decodes `s`.  With `plusAsSpace`, '+' becomes ' ' as in
   * form-encoded query strings.  Malformed escapes are kept literally.
   */
  static string decode(const string& s, bool plusAsSpace = false);

  /** @brief Percent-encodes everything outside the RFC 3986 unreserved set. */
  static string encode(const string& s);

  /** @brief Non-empty path segments, decoded. */
  static vector<string> pathSegments(const string& path);

  /** @brief Removes `prefix` from the front of `path` if it is there. */
  static string stripPrefix(const string& path, const string& prefix);

  /** @brief Reads an integer query value, or `defaultValue` if absent/bad. */
  static int queryInt(const map<string, string>& query, const string& key,
                      int defaultValue);
};
}  // namespace wt

#endif  // __WT_URL_UTILS__
