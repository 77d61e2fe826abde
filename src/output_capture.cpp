#include "replaycue/output_capture.h"
#include "replaycue/replaycue.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>

#include <unistd.h>

namespace replaycue {

bool OutputCapture::Start(unsigned streams, LineCallback callback) {
  if (active_) {
    last_error_ = "output capture already active";
    return false;
  }
  if ((streams & (kCaptureStdout | kCaptureStderr)) == 0) {
    last_error_ = "no streams selected for capture";
    return false;
  }
  if (!callback) {
    last_error_ = "output capture requires a line callback";
    return false;
  }
  callback_ = std::move(callback);
  stdout_ = StreamRedirect{};
  stderr_ = StreamRedirect{};
  stdout_.stream = kCaptureStdout;
  stdout_.target_fd = STDOUT_FILENO;
  stderr_.stream = kCaptureStderr;
  stderr_.target_fd = STDERR_FILENO;

  if ((streams & kCaptureStdout) != 0 && !Redirect(&stdout_)) {
    return false;
  }
  if ((streams & kCaptureStderr) != 0 && !Redirect(&stderr_)) {
    Restore(&stdout_);
    return false;
  }
  active_ = true;
  return true;
}

void OutputCapture::Stop() {
  if (!active_) {
    return;
  }
  Restore(&stderr_);
  Restore(&stdout_);
  active_ = false;
}

bool OutputCapture::Redirect(StreamRedirect* redirect) {
  int fds[2] = {-1, -1};
  if (::pipe(fds) < 0) {
    last_error_ = "pipe() failed: " + std::string(std::strerror(errno));
    return false;
  }
  // Push out anything buffered for the original destination first.
  if (redirect->stream == kCaptureStdout) {
    std::cout.flush();
    std::fflush(stdout);
  } else {
    std::cerr.flush();
    std::fflush(stderr);
  }
  const int saved = ::dup(redirect->target_fd);
  if (saved < 0) {
    last_error_ = "dup() failed: " + std::string(std::strerror(errno));
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }
  if (::dup2(fds[1], redirect->target_fd) < 0) {
    last_error_ = "dup2() failed: " + std::string(std::strerror(errno));
    ::close(saved);
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }
  ::close(fds[1]);
  redirect->saved_fd = saved;
  redirect->read_fd = fds[0];
  redirect->reader = std::thread([this, redirect]() { ReadLoop(redirect); });
  return true;
}

void OutputCapture::Restore(StreamRedirect* redirect) {
  if (redirect->saved_fd < 0) {
    return;
  }
  if (redirect->stream == kCaptureStdout) {
    std::cout.flush();
    std::fflush(stdout);
  } else {
    std::cerr.flush();
    std::fflush(stderr);
  }
  // Replacing the target drops the last write end of the pipe, so the reader
  // sees EOF once it has drained what was written.
  ::dup2(redirect->saved_fd, redirect->target_fd);
  ::close(redirect->saved_fd);
  redirect->saved_fd = -1;
  if (redirect->reader.joinable()) {
    redirect->reader.join();
  }
  ::close(redirect->read_fd);
  redirect->read_fd = -1;
}

void OutputCapture::ReadLoop(StreamRedirect* redirect) {
  char buffer[4096];
  std::string pending;
  while (true) {
    const ssize_t bytes = ::read(redirect->read_fd, buffer, sizeof(buffer));
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    if (bytes <= 0) {
      break;
    }
    pending.append(buffer, static_cast<size_t>(bytes));
    size_t start = 0;
    size_t newline = pending.find('\n', start);
    while (newline != std::string::npos) {
      Emit(redirect->stream, pending.substr(start, newline - start));
      start = newline + 1;
      newline = pending.find('\n', start);
    }
    pending.erase(0, start);
  }
  if (!pending.empty()) {
    Emit(redirect->stream, std::move(pending));
  }
}

void OutputCapture::Emit(unsigned stream, std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  lines_captured_.fetch_add(1);
  // The sink may not write to the captured stream, so failures are only counted.
  try {
    callback_(stream, line);
  } catch (const std::exception&) {
    callback_exceptions_.fetch_add(1);
  } catch (...) {
    callback_exceptions_.fetch_add(1);
  }
}

}  // namespace replaycue
