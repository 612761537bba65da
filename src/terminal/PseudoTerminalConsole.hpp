#ifndef __WT_PSEUDO_TERMINAL_CONSOLE__
#define __WT_PSEUDO_TERMINAL_CONSOLE__

#include "Console.hpp"

namespace wt {
/**
 * @brief The local tty in raw mode.
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() : active(false) {
    tcgetattr(STDIN_FILENO, &terminalBackup);
  }

  virtual ~PseudoTerminalConsole() {
    if (active) {
      teardown();
    }
  }

  virtual void setup() {
    termios terminalLocal;
    tcgetattr(STDIN_FILENO, &terminalLocal);
    memcpy(&terminalBackup, &terminalLocal, sizeof(struct termios));
    cfmakeraw(&terminalLocal);
    tcsetattr(STDIN_FILENO, TCSANOW, &terminalLocal);
    active = true;
  }

  virtual void teardown() {
    tcsetattr(STDIN_FILENO, TCSANOW, &terminalBackup);
    active = false;
  }

  virtual TerminalGeometry getGeometry() {
    winsize win;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == -1 || win.ws_col == 0 ||
        win.ws_row == 0) {
      // Not a tty (piped output); fall back to the classic size.
      return makeGeometry(80, 24);
    }
    return makeGeometry(win.ws_col, win.ws_row);
  }

  virtual int getFd() { return STDOUT_FILENO; }

 protected:
  termios terminalBackup;
  bool active;
};
}  // namespace wt

#endif  // __WT_PSEUDO_TERMINAL_CONSOLE__
