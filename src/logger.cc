// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <mutex>
#include <shared_mutex>
#include <sys/syscall.h>
#include <unistd.h>

#ifndef LOG_MSG_CAP
#  define LOG_MSG_CAP 4096
#endif

namespace profship {

namespace {

// Lines are emitted by samplers, the timer thread and the flush thread: a
// line is a single write() made under the shared side of fd_mutex, so closing
// the descriptor waits for writes in progress
struct LoggerContext {
  std::shared_mutex fd_mutex;
  std::atomic<int> fd{-1};
  std::atomic<int> mode{LOG_STDERR};
  std::atomic<int> level{LL_ERROR};
};

LoggerContext log_ctx;

constexpr const char *k_level_names[LL_LENGTH] = {
    "EMERGENCY", "ALERT",  "CRITICAL",      "ERROR",
    "WARNING",   "NOTICE", "INFORMATIONAL", "DEBUG",
};

int current_tid() {
  thread_local int const tid = static_cast<int>(syscall(SYS_gettid));
  return tid;
}

// `<LEVEL>mmm dd HH:MM:SS.uuuuuu name[pid:tid]: `
int format_header(char *buf, size_t cap, int lvl, const char *name) {
  using namespace std::chrono;
  auto const since_epoch = system_clock::now().time_since_epoch();
  auto const secs = duration_cast<seconds>(since_epoch);
  auto const usecs = duration_cast<microseconds>(since_epoch - secs);

  time_t const t = secs.count();
  struct tm lt;
  localtime_r(&t, &lt);
  char tm_str[sizeof("mmm dd HH:MM:SS0")];
  if (strftime(tm_str, sizeof(tm_str), "%b %d %H:%M:%S", &lt) == 0) {
    tm_str[0] = '\0';
  }
  return snprintf(buf, cap, "<%s>%s.%06ld %s[%d:%d]: ", k_level_names[lvl],
                  tm_str, static_cast<long>(usecs.count()), name, getpid(),
                  current_tid());
}

void write_all(int fd, const char *buf, size_t sz) {
  while (sz > 0) {
    ssize_t const rc = write(fd, buf, sz);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return; // nowhere left to report it
    }
    buf += rc;
    sz -= rc;
  }
}

} // namespace

void LOG_setlevel(int lvl) {
  if (lvl >= LL_EMERGENCY && lvl <= LL_DEBUG) {
    log_ctx.level = lvl;
  }
}

int LOG_getlevel() { return log_ctx.level; }

bool LOG_is_logging_enabled_for_level(int level) {
  return level <= log_ctx.level;
}

void LOG_close() {
  std::unique_lock const lock(log_ctx.fd_mutex);
  int const fd = log_ctx.fd.exchange(-1);
  if (fd >= 0 && log_ctx.mode == LOG_FILE) {
    close(fd);
  }
}

bool LOG_open(int mode, const char *opts) {
  LOG_close();

  int fd = -1;
  switch (mode) {
  case LOG_DISABLE:
    break;
  case LOG_STDERR:
    fd = STDERR_FILENO;
    break;
  case LOG_FILE:
    if (!opts || !*opts) {
      return false;
    }
    fd = open(opts, O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd == -1) {
      return false;
    }
    break;
  case LOG_STDOUT:
  default:
    mode = LOG_STDOUT;
    fd = STDOUT_FILENO;
    break;
  }
  std::unique_lock const lock(log_ctx.fd_mutex);
  log_ctx.mode = mode;
  log_ctx.fd = fd;
  return true;
}

void vlprintfln(int lvl, const char *name, const char *format, va_list args) {
  if (log_ctx.fd < 0 || !format) {
    return;
  }
  if (lvl < LL_EMERGENCY || lvl >= LL_LENGTH) {
    lvl = log_ctx.level;
  }

  char buf[LOG_MSG_CAP];
  int const sz_h = format_header(buf, sizeof(buf), lvl, name ? name : MYNAME);
  if (sz_h < 0 || sz_h >= LOG_MSG_CAP - 2) {
    return;
  }

  // keep room for the newline and \0, long messages are truncated
  int const cap = LOG_MSG_CAP - sz_h - 1;
  int sz = vsnprintf(&buf[sz_h], cap, format, args);
  if (sz < 0) {
    return;
  }
  if (sz > cap - 1) {
    sz = cap - 1;
  }
  sz += sz_h;
  buf[sz++] = '\n';

  std::shared_lock const lock(log_ctx.fd_mutex);
  int const fd = log_ctx.fd;
  if (fd >= 0) {
    write_all(fd, buf, sz);
  }
}

// NOLINTNEXTLINE(cert-dcl50-cpp)
void olprintfln(int lvl, const char *name, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlprintfln(lvl, name, fmt, args);
  va_end(args);
}

// NOLINTNEXTLINE(cert-dcl50-cpp)
void lprintfln(int lvl, const char *name, const char *fmt, ...) {
  if (!LOG_is_logging_enabled_for_level(lvl)) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  vlprintfln(lvl, name, fmt, args);
  va_end(args);
}

} // namespace profship
