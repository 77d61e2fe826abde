#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace replaycue {

/**
 * Wire opcodes carried in the "op" field of every frame.
 */
enum class OpCode : int {
  kHello = 0,
  kIdentify = 1,
  kIdentified = 2,
  kReidentify = 3,
  kEvent = 5,
  kRequest = 6,
  kRequestResponse = 7,
  kRequestBatch = 8,
  kRequestBatchResponse = 9,
};

/**
 * Request status codes used by this library.
 */
constexpr int kRequestStatusSuccess = 100;
constexpr int kRequestStatusOutputRunning = 500;
constexpr int kRequestStatusOutputNotRunning = 501;
constexpr int kRequestStatusResourceNotFound = 600;

/**
 * WebSocket close codes the remote end uses to reject a session.
 */
constexpr int kCloseCodeAuthenticationFailed = 4009;
constexpr int kCloseCodeUnsupportedRpcVersion = 4010;

constexpr const char* kWebSocketSubprotocol = "obswebsocket.json";

struct AuthChallenge {
  std::string challenge;
  std::string salt;
};

struct HelloMessage {
  std::string server_version;
  int rpc_version = 0;
  std::optional<AuthChallenge> authentication;
};

struct IdentifyMessage {
  int rpc_version = 0;
  std::optional<std::string> authentication;
  uint32_t event_subscriptions = 0;
};

struct IdentifiedMessage {
  int negotiated_rpc_version = 0;
};

struct ReidentifyMessage {
  uint32_t event_subscriptions = 0;
};

struct EventMessage {
  std::string event_type;
  uint32_t event_intent = 0;
  nlohmann::json event_data;
};

struct RequestMessage {
  std::string request_type;
  std::string request_id;
  nlohmann::json request_data;
};

struct RequestStatus {
  bool result = false;
  int code = 0;
  std::string comment;
};

struct RequestResponseMessage {
  std::string request_type;
  std::string request_id;
  RequestStatus status;
  nlohmann::json response_data;
};

struct RequestBatchMessage {
  std::string request_id;
  bool halt_on_failure = false;
  std::vector<RequestMessage> requests;
};

struct RequestBatchResponseMessage {
  std::string request_id;
  std::vector<RequestResponseMessage> results;
};

/// A server frame with an opcode this library does not know.
struct UnknownMessage {
  int op = 0;
  nlohmann::json data;
};

/// Messages the server sends to the client.
using IncomingMessage = std::variant<HelloMessage,
                                     IdentifiedMessage,
                                     EventMessage,
                                     RequestResponseMessage,
                                     RequestBatchResponseMessage,
                                     UnknownMessage>;

/// Messages the client sends to the server.
using OutgoingMessage = std::variant<IdentifyMessage,
                                     ReidentifyMessage,
                                     RequestMessage,
                                     RequestBatchMessage>;

/**
 * Client-side encoders. Output is deterministic: object keys are emitted in
 * sorted order and optional fields are omitted when absent.
 */
std::string EncodeIdentify(const IdentifyMessage& message);
std::string EncodeReidentify(const ReidentifyMessage& message);
std::string EncodeRequest(const RequestMessage& message);
std::string EncodeRequestBatch(const RequestBatchMessage& message);

/**
 * Server-side encoders, used by fixtures and fake servers.
 */
std::string EncodeHello(const HelloMessage& message);
std::string EncodeIdentified(const IdentifiedMessage& message);
std::string EncodeEvent(const EventMessage& message);
std::string EncodeRequestResponse(const RequestResponseMessage& message);
std::string EncodeRequestBatchResponse(const RequestBatchResponseMessage& message);

/**
 * Decode a server-to-client frame.
 *
 * Unknown optional fields are ignored and unknown opcodes decode to
 * UnknownMessage. Invalid JSON, missing required fields, wrong field types and
 * client-only opcodes fail.
 *
 * @param text Frame payload.
 * @param out Decoded message.
 * @param error Optional output string describing the schema violation.
 * @return true on success.
 */
bool DecodeIncoming(const std::string& text, IncomingMessage* out,
                    std::string* error = nullptr);

/**
 * Decode a client-to-server frame (the server side of the codec).
 */
bool DecodeOutgoing(const std::string& text, OutgoingMessage* out,
                    std::string* error = nullptr);

/**
 * Compute the Identify authentication string:
 * base64(sha256(base64(sha256(password + salt)) + challenge)).
 */
std::string ComputeAuthResponse(const std::string& password,
                                const std::string& salt,
                                const std::string& challenge);

const char* OpCodeName(int op);

}  // namespace replaycue
