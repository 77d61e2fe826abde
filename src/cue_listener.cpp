#include "replaycue/cue_listener.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace replaycue {
namespace {

constexpr size_t kMaxDatagramSize = 1024;

std::string Trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool IsValidIpv4(const std::string& addr) {
  in_addr parsed{};
  return !addr.empty() && inet_pton(AF_INET, addr.c_str(), &parsed) == 1;
}

}  // namespace

bool CueListenerConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!IsValidIpv4(bind_address)) {
    return fail("bind_address must be a valid IPv4 address");
  }
  if (trigger_commands.empty()) {
    return fail("trigger_commands must not be empty");
  }
  for (const auto& command : trigger_commands) {
    if (Trim(command).empty()) {
      return fail("trigger commands must not be blank");
    }
  }
  return true;
}

std::optional<std::string> ParseCueCommand(const std::string& datagram) {
  const std::string text = Trim(datagram);
  if (text.empty()) {
    return std::nullopt;
  }
  if (text.front() == '{') {
    nlohmann::json message = nlohmann::json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
      return std::nullopt;
    }
    auto cmd = message.find("cmd");
    if (cmd == message.end() || !cmd->is_string()) {
      return std::nullopt;
    }
    std::string command = Trim(cmd->get<std::string>());
    if (command.empty()) {
      return std::nullopt;
    }
    return command;
  }
  // Bare command word.
  const bool word = std::all_of(text.begin(), text.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  });
  if (!word) {
    return std::nullopt;
  }
  return text;
}

CueListener::CueListener(CueListenerConfig config, Logger logger)
    : config_(std::move(config)), logger_(std::move(logger)) {}

CueListener::~CueListener() { Stop(); }

bool CueListener::Start() {
  if (running_) {
    return true;
  }
  std::string error;
  if (!config_.Validate(&error)) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = "invalid cue listener config: " + error;
    logger_.Error(last_error_);
    return false;
  }
  auto fail = [&](const std::string& message) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_error_ = message;
    }
    logger_.Error(message);
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
    return false;
  };

  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    return fail("socket() failed: " + std::string(std::strerror(errno)));
  }
  int reuse = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    return fail("setsockopt(SO_REUSEADDR) failed: " + std::string(std::strerror(errno)));
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(config_.port);
  inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::ostringstream oss;
    oss << "bind(" << config_.bind_address << ":" << config_.port
        << ") failed: " << std::strerror(errno);
    return fail(oss.str());
  }
  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) < 0) {
    return fail("getsockname() failed: " + std::string(std::strerror(errno)));
  }
  bound_port_ = ntohs(bound.sin_port);

  running_ = true;
  recv_thread_ = std::thread([this]() { RecvLoop(); });
  logger_.Info("cue listener on " + config_.bind_address + ":" +
               std::to_string(bound_port_));
  return true;
}

void CueListener::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (recv_thread_.joinable()) {
    recv_thread_.join();
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void CueListener::SetCueCallback(CueCallback cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  cue_cb_ = std::move(cb);
}

bool CueListener::IsTriggerCommand(const std::string& command) const {
  return std::any_of(config_.trigger_commands.begin(), config_.trigger_commands.end(),
                     [&](const std::string& trigger) {
                       return EqualsIgnoreCase(Trim(trigger), command);
                     });
}

std::string CueListener::GetLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

CueListenerMetrics CueListener::GetMetrics() const {
  CueListenerMetrics metrics;
  metrics.datagrams_received = datagrams_received_.load();
  metrics.cues_triggered = cues_triggered_.load();
  metrics.ignored_commands = ignored_commands_.load();
  metrics.parse_errors = parse_errors_.load();
  metrics.callback_exceptions = callback_exceptions_.load();
  return metrics;
}

void CueListener::RecvLoop() {
  char buffer[kMaxDatagramSize];
  while (running_) {
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(fd_, &readfds);
    timeval tv{};
    tv.tv_sec = 0;
    tv.tv_usec = 200000;
    const int ready = ::select(fd_ + 1, &readfds, nullptr, nullptr, &tv);
    if (ready <= 0) {
      continue;
    }
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t bytes = ::recvfrom(fd_, buffer, sizeof(buffer), 0,
                                     reinterpret_cast<sockaddr*>(&from), &from_len);
    if (bytes <= 0) {
      continue;
    }
    datagrams_received_.fetch_add(1);
    HandleDatagram(std::string(buffer, static_cast<size_t>(bytes)));
  }
}

void CueListener::HandleDatagram(const std::string& datagram) {
  std::optional<std::string> command = ParseCueCommand(datagram);
  if (!command) {
    parse_errors_.fetch_add(1);
    logger_.Warn("unparseable cue datagram (" + std::to_string(datagram.size()) + " bytes)");
    return;
  }
  if (!IsTriggerCommand(*command)) {
    ignored_commands_.fetch_add(1);
    logger_.Debug("cue command '" + *command + "' ignored");
    return;
  }
  cues_triggered_.fetch_add(1);
  logger_.Info("cue command '" + *command + "' received");
  CueCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = cue_cb_;
  }
  if (!cb) {
    return;
  }
  try {
    cb(*command);
  } catch (const std::exception& e) {
    callback_exceptions_.fetch_add(1);
    logger_.Error(std::string("cue callback threw: ") + e.what());
  } catch (...) {
    callback_exceptions_.fetch_add(1);
    logger_.Error("cue callback threw");
  }
}

}  // namespace replaycue
