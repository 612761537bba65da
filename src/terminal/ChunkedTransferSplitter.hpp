#ifndef __WT_CHUNKED_TRANSFER_SPLITTER__
#define __WT_CHUNKED_TRANSFER_SPLITTER__

#include "Headers.hpp"

namespace wt {
struct ChunkingConfig {
  /** @brief Inputs longer than this many bytes are split.  0 disables. */
  size_t threshold = DEFAULT_CHUNK_THRESHOLD;
  /** @brief Upper bound on a fragment, in bytes. */
  size_t fragmentSize = DEFAULT_CHUNK_FRAGMENT_SIZE;
  /** @brief Pause between consecutive fragments. */
  std::chrono::milliseconds interFragmentDelay =
      std::chrono::milliseconds(DEFAULT_CHUNK_DELAY_MS);
  /** @brief Rewrite bare LF as CRLF before splitting. */
  bool normalizeNewlines = true;
};

/**
 * @brief An ordered list of fragments plus a send cursor.
 */
class ChunkedTransfer {
 public:
  explicit ChunkedTransfer(const vector<string>& _fragments)
      : fragments(_fragments), cursor(0) {}

  bool hasNext() const { return cursor < fragments.size(); }

  /** @brief Returns the fragment under the cursor and advances it. */
  const string& next() { return fragments.at(cursor++); }

  size_t size() const { return fragments.size(); }

  size_t sent() const { return cursor; }

 protected:
  vector<string> fragments;
  size_t cursor;
};

/**
 * @brief Breaks oversized client text (pastes) into bounded, UTF-8 safe
 * fragments that are delivered with a pause between them.
 */
class ChunkedTransferSplitter {
 public:
  explicit ChunkedTransferSplitter(const ChunkingConfig& _config);

  /** @brief True if `text` is large enough to be sent as a ChunkedTransfer. */
  bool shouldSplit(const string& text) const {
    return config.threshold > 0 && text.size() > config.threshold;
  }

  /**
   * @brief Normalizes newlines (if configured) and splits the result.
   */
  shared_ptr<ChunkedTransfer> createTransfer(const string& text) const;

  /**
   * @brief Splits `text` verbatim.  Concatenating the result reproduces
   * `text`, and no fragment ends inside a UTF-8 sequence.
   */
  vector<string> split(const string& text) const;

  /** @brief Rewrites every LF not preceded by CR as CRLF. */
  static string normalizeNewlines(const string& text);

  const ChunkingConfig& getConfig() const { return config; }

 protected:
  ChunkingConfig config;
};
}  // namespace wt

#endif  // __WT_CHUNKED_TRANSFER_SPLITTER__
