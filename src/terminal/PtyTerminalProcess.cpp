#include "PtyTerminalProcess.hpp"

extern char** environ;

namespace th {
PtyTerminalProcess::PtyTerminalProcess(const SpawnOptions& _options)
    : options(_options), masterFd(-1), childPid(-1) {}

PtyTerminalProcess::~PtyTerminalProcess() { terminate(); }

vector<string> PtyTerminalProcess::buildEnvironment() const {
  map<string, string> merged;
  for (char** env = environ; env && *env; env++) {
    string entry(*env);
    auto eq = entry.find('=');
    if (eq == string::npos) {
      continue;
    }
    merged[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  merged["TERM"] = "xterm-256color";
  merged["TERMHUB_VERSION"] = TH_VERSION;
  for (const auto& it : options.environment) {
    merged[it.first] = it.second;
  }
  vector<string> retval;
  for (const auto& it : merged) {
    retval.push_back(it.first + "=" + it.second);
  }
  return retval;
}

void PtyTerminalProcess::start() {
  lock_guard<recursive_mutex> guard(processMutex);
  if (childPid > 0) {
    throw std::runtime_error("Terminal process already started");
  }

  // Everything the child needs is prepared before fork() so the child only
  // makes async-signal-safe calls.
  string shell = options.shell.empty() ? string("/bin/sh") : options.shell;
  vector<string> envStrings = buildEnvironment();
  vector<char*> envp;
  for (auto& s : envStrings) {
    envp.push_back(&s[0]);
  }
  envp.push_back(NULL);
  string workingDirectory = options.workingDirectory;
  string home;
  passwd* pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_dir != NULL) {
    home = pwd->pw_dir;
  }

  winsize ws;
  memset(&ws, 0, sizeof(ws));
  ws.ws_row = options.dimensions.rows > 0 ? options.dimensions.rows : 24;
  ws.ws_col = options.dimensions.cols > 0 ? options.dimensions.cols : 80;

  int fd = -1;
  pid_t pid = forkpty(&fd, NULL, NULL, &ws);
  if (pid < 0) {
    auto localErrno = GetErrno();
    STERROR << "forkpty failed: " << strerror(localErrno);
    throw std::runtime_error(string("Could not spawn terminal: ") +
                             strerror(localErrno));
  }
  if (pid == 0) {
    if (workingDirectory.empty() || ::chdir(workingDirectory.c_str()) != 0) {
      if (!home.empty() && ::chdir(home.c_str()) != 0) {
        ::chdir("/");
      }
    }
    // Shells remember the inherited SIGCHLD disposition, so hand them the
    // default one.
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    execle(shell.c_str(), shell.c_str(), (char*)NULL, envp.data());
    _exit(127);
  }

  masterFd = fd;
  childPid = pid;
  int opts = fcntl(masterFd, F_GETFL);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(masterFd, F_SETFL, opts | O_NONBLOCK));
  LOG(INFO) << "Spawned " << shell << " as pid " << childPid << " on pty fd "
            << masterFd;
}

int PtyTerminalProcess::getFd() {
  lock_guard<recursive_mutex> guard(processMutex);
  return masterFd;
}

void PtyTerminalProcess::resize(const Dimensions& dimensions) {
  lock_guard<recursive_mutex> guard(processMutex);
  if (masterFd < 0) {
    return;
  }
  winsize ws;
  memset(&ws, 0, sizeof(ws));
  ws.ws_row = dimensions.rows;
  ws.ws_col = dimensions.cols;
  if (ioctl(masterFd, TIOCSWINSZ, &ws) == -1) {
    LOG(WARNING) << "Could not resize pty " << masterFd << ": "
                 << strerror(GetErrno());
  }
}

optional<int> PtyTerminalProcess::pollExit(bool block) {
  lock_guard<recursive_mutex> guard(processMutex);
  if (exitCode || childPid <= 0) {
    return exitCode;
  }
  int status = 0;
  pid_t rc = waitpid(childPid, &status, block ? 0 : WNOHANG);
  if (rc == 0) {
    return nullopt;
  }
  if (rc < 0) {
    if (GetErrno() == ECHILD) {
      // Someone else reaped it
      exitCode = -1;
    }
    return exitCode;
  }
  if (WIFEXITED(status)) {
    exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exitCode = 128 + WTERMSIG(status);
  } else {
    return nullopt;
  }
  VLOG(1) << "Process " << childPid << " exited with " << *exitCode;
  return exitCode;
}

void PtyTerminalProcess::terminate() {
  lock_guard<recursive_mutex> guard(processMutex);
  if (childPid > 0 && !exitCode) {
    ::kill(childPid, SIGHUP);
    for (int i = 0; i < 50 && !pollExit(false); i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!pollExit(false)) {
      LOG(WARNING) << "Process " << childPid << " ignored SIGHUP, killing";
      ::kill(childPid, SIGKILL);
      pollExit(true);
    }
  }
  if (masterFd >= 0) {
    FATAL_FAIL(::close(masterFd));
    masterFd = -1;
  }
}
}  // namespace th
