#include "ChunkedTransferSplitter.hpp"

namespace wt {
namespace {
inline bool isUtf8Continuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}
}  // namespace

ChunkedTransferSplitter::ChunkedTransferSplitter(const ChunkingConfig& _config)
    : config(_config) {
  if (config.fragmentSize < 4) {
    // A fragment must be able to hold the longest UTF-8 sequence.
    STFATAL << "Fragment size too small: " << config.fragmentSize;
  }
}

shared_ptr<ChunkedTransfer> ChunkedTransferSplitter::createTransfer(
    const string& text) const {
  string normalized = config.normalizeNewlines ? normalizeNewlines(text) : text;
  auto transfer = make_shared<ChunkedTransfer>(split(normalized));
  VLOG(1) << "Split " << normalized.size() << " bytes into "
          << transfer->size() << " fragments";
  return transfer;
}

vector<string> ChunkedTransferSplitter::split(const string& text) const {
  vector<string> fragments;
  if (!shouldSplit(text)) {
    if (!text.empty()) {
      fragments.push_back(text);
    }
    return fragments;
  }

  size_t start = 0;
  while (start < text.size()) {
    size_t end = min(start + config.fragmentSize, text.size());
    if (end < text.size()) {
      // Back off so the next fragment starts on a lead byte.
      size_t boundary = end;
      while (boundary > start && isUtf8Continuation(text[boundary])) {
        boundary--;
      }
      // Only continuation bytes in range (invalid UTF-8): cut anyway.
      if (boundary > start) {
        end = boundary;
      }
      // Keep CRLF pairs in one fragment.
      if (end - 1 > start && text[end - 1] == '\r' && text[end] == '\n') {
        end--;
      }
    }
    fragments.push_back(text.substr(start, end - start));
    start = end;
  }
  return fragments;
}

string ChunkedTransferSplitter::normalizeNewlines(const string& text) {
  string result;
  result.reserve(text.size() + text.size() / 16);
  for (size_t i = 0; i < text.size(); i++) {
    if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) {
      result.push_back('\r');
    }
    result.push_back(text[i]);
  }
  return result;
}
}  // namespace wt
