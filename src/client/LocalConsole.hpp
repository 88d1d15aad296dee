#ifndef __TH_LOCAL_CONSOLE__
#define __TH_LOCAL_CONSOLE__

#include "Headers.hpp"
#include "RawSocketUtils.hpp"

namespace th {
/**
 * @brief The controlling tty of termhub-client: raw mode on setup, restored
 * on teardown.
 */
class LocalConsole {
 public:
  LocalConsole() : rawMode(false) {
    memset(&terminalBackup, 0, sizeof(terminalBackup));
  }

  virtual ~LocalConsole() { teardown(); }

  void setup() {
    if (rawMode || !isatty(STDIN_FILENO)) {
      return;
    }
    termios terminalLocal;
    tcgetattr(STDIN_FILENO, &terminalLocal);
    memcpy(&terminalBackup, &terminalLocal, sizeof(struct termios));
    cfmakeraw(&terminalLocal);
    tcsetattr(STDIN_FILENO, TCSANOW, &terminalLocal);
    rawMode = true;
  }

  void teardown() {
    if (!rawMode) {
      return;
    }
    tcsetattr(STDIN_FILENO, TCSANOW, &terminalBackup);
    rawMode = false;
  }

  WindowSize getWindowSize() {
    winsize win;
    memset(&win, 0, sizeof(win));
    WindowSize ti;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == -1 || win.ws_row == 0) {
      ti.set_row(24);
      ti.set_column(80);
      return ti;
    }
    ti.set_row(win.ws_row);
    ti.set_column(win.ws_col);
    return ti;
  }

  void write(const string& s) {
    RawSocketUtils::writeAll(STDOUT_FILENO, &s[0], s.length());
  }

  int getFd() { return STDIN_FILENO; }

 protected:
  termios terminalBackup;
  bool rawMode;
};
}  // namespace th

#endif  // __TH_LOCAL_CONSOLE__
