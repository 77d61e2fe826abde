#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace replaycue {

/**
 * Redirects process stdout and/or stderr into a line callback.
 *
 * Start() swaps the stream's file descriptor for a pipe and a reader thread
 * splits what is written into lines. Stop() flushes, restores the original
 * descriptors and joins the reader. Only one capture per stream may be active
 * in a process.
 */
class OutputCapture {
 public:
  /// stream is kCaptureStdout or kCaptureStderr.
  using LineCallback = std::function<void(unsigned stream, const std::string& line)>;

  OutputCapture() = default;
  ~OutputCapture() { Stop(); }

  OutputCapture(const OutputCapture&) = delete;
  OutputCapture& operator=(const OutputCapture&) = delete;

  /**
   * Begin capturing.
   *
   * @param streams Bitmask of kCaptureStdout / kCaptureStderr.
   * @param callback Receives each completed line (without the newline).
   * @return false on failure; last_error() describes it.
   */
  bool Start(unsigned streams, LineCallback callback);
  void Stop();

  bool active() const { return active_; }
  const std::string& last_error() const { return last_error_; }
  uint64_t lines_captured() const { return lines_captured_.load(); }
  uint64_t callback_exceptions() const { return callback_exceptions_.load(); }

 private:
  struct StreamRedirect {
    unsigned stream = 0;
    int target_fd = -1;
    int saved_fd = -1;
    int read_fd = -1;
    std::thread reader;
  };

  bool Redirect(StreamRedirect* redirect);
  void Restore(StreamRedirect* redirect);
  void ReadLoop(StreamRedirect* redirect);
  void Emit(unsigned stream, std::string line);

  LineCallback callback_;
  StreamRedirect stdout_;
  StreamRedirect stderr_;
  std::atomic<bool> active_{false};
  std::string last_error_;
  std::atomic<uint64_t> lines_captured_{0};
  std::atomic<uint64_t> callback_exceptions_{0};
};

}  // namespace replaycue
