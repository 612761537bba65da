#ifndef __WT_CONSOLE__
#define __WT_CONSOLE__

#include "Headers.hpp"
#include "RawSocketUtils.hpp"
#include "RemoteExec.hpp"

namespace wt {
/**
 * @brief Abstract console interface used by TerminalClient.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Current window size in character cells. */
  virtual TerminalGeometry getGeometry() = 0;
  /** @brief Puts the console in the mode the remote shell expects. */
  virtual void setup() = 0;
  /** @brief Restores the console state before exiting. */
  virtual void teardown() = 0;
  /** @brief Provides the descriptor that receives terminal output. */
  virtual int getFd() = 0;

  virtual void write(const string& s) {
    RawSocketUtils::writeAll(getFd(), &s[0], s.length());
  }
};

/**
 * @brief Remote output rendered straight onto a Console.
 */
class ConsoleSink : public TerminalSink {
 public:
  explicit ConsoleSink(shared_ptr<Console> _console) : console(_console) {}

  virtual ~ConsoleSink() {}

  virtual void write(const string& s) {
    std::lock_guard<std::mutex> guard(sinkMutex);
    console->write(s);
  }

 protected:
  shared_ptr<Console> console;
  std::mutex sinkMutex;
};
}  // namespace wt

#endif  // __WT_CONSOLE__
