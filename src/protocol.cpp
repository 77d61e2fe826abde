#include "replaycue/protocol.h"

#include <cstdint>
#include <limits>
#include <sstream>

#include <openssl/evp.h>

namespace replaycue {
namespace {

using nlohmann::json;

// Field access helpers. Each returns false and fills error on a schema
// violation; optional variants leave the output untouched when absent.
bool Fail(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

bool RequireObject(const json& parent, const char* key, const json** out,
                   std::string* error) {
  auto it = parent.find(key);
  if (it == parent.end() || !it->is_object()) {
    return Fail(error, std::string("missing or non-object field '") + key + "'");
  }
  *out = &*it;
  return true;
}

bool RequireString(const json& parent, const char* key, std::string* out,
                   std::string* error) {
  auto it = parent.find(key);
  if (it == parent.end() || !it->is_string()) {
    return Fail(error, std::string("missing or non-string field '") + key + "'");
  }
  *out = it->get<std::string>();
  return true;
}

bool RequireInt(const json& parent, const char* key, int* out, std::string* error) {
  auto it = parent.find(key);
  if (it == parent.end() || !it->is_number_integer()) {
    return Fail(error, std::string("missing or non-integer field '") + key + "'");
  }
  const bool in_range =
      it->is_number_unsigned()
          ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
          : it->get<int64_t>() >= std::numeric_limits<int>::min() &&
                it->get<int64_t>() <= std::numeric_limits<int>::max();
  if (!in_range) {
    return Fail(error, std::string("integer field '") + key + "' out of range");
  }
  *out = it->get<int>();
  return true;
}

bool RequireBool(const json& parent, const char* key, bool* out, std::string* error) {
  auto it = parent.find(key);
  if (it == parent.end() || !it->is_boolean()) {
    return Fail(error, std::string("missing or non-boolean field '") + key + "'");
  }
  *out = it->get<bool>();
  return true;
}

bool OptionalString(const json& parent, const char* key, std::string* out,
                    std::string* error) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    return Fail(error, std::string("field '") + key + "' must be a string");
  }
  *out = it->get<std::string>();
  return true;
}

bool OptionalBool(const json& parent, const char* key, bool* out, std::string* error) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    return true;
  }
  if (!it->is_boolean()) {
    return Fail(error, std::string("field '") + key + "' must be a boolean");
  }
  *out = it->get<bool>();
  return true;
}

bool OptionalMask(const json& parent, const char* key, uint32_t* out,
                  std::string* error) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number_unsigned() || it->get<uint64_t>() > 0xffffffffu) {
    return Fail(error, std::string("field '") + key + "' must be an unsigned 32-bit integer");
  }
  *out = it->get<uint32_t>();
  return true;
}

// Data payloads may be absent or null; anything present must be an object.
bool OptionalData(const json& parent, const char* key, json* out, std::string* error) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    *out = json::object();
    return true;
  }
  if (!it->is_object()) {
    return Fail(error, std::string("field '") + key + "' must be an object");
  }
  *out = *it;
  return true;
}

std::string Frame(OpCode op, json data) {
  json frame;
  frame["op"] = static_cast<int>(op);
  frame["d"] = std::move(data);
  return frame.dump();
}

json StatusToJson(const RequestStatus& status) {
  json out;
  out["result"] = status.result;
  out["code"] = status.code;
  if (!status.comment.empty()) {
    out["comment"] = status.comment;
  }
  return out;
}

json ResponseToJson(const RequestResponseMessage& message) {
  json d;
  d["requestType"] = message.request_type;
  if (!message.request_id.empty()) {
    d["requestId"] = message.request_id;
  }
  d["requestStatus"] = StatusToJson(message.status);
  if (message.response_data.is_object() && !message.response_data.empty()) {
    d["responseData"] = message.response_data;
  }
  return d;
}

json RequestToJson(const RequestMessage& message) {
  json d;
  d["requestType"] = message.request_type;
  if (!message.request_id.empty()) {
    d["requestId"] = message.request_id;
  }
  if (message.request_data.is_object() && !message.request_data.empty()) {
    d["requestData"] = message.request_data;
  }
  return d;
}

bool ParseResponse(const json& d, bool require_id, RequestResponseMessage* out,
                   std::string* error) {
  if (!RequireString(d, "requestType", &out->request_type, error)) {
    return false;
  }
  if (require_id) {
    if (!RequireString(d, "requestId", &out->request_id, error)) {
      return false;
    }
  } else if (!OptionalString(d, "requestId", &out->request_id, error)) {
    return false;
  }
  const json* status = nullptr;
  if (!RequireObject(d, "requestStatus", &status, error)) {
    return false;
  }
  if (!RequireBool(*status, "result", &out->status.result, error) ||
      !RequireInt(*status, "code", &out->status.code, error) ||
      !OptionalString(*status, "comment", &out->status.comment, error)) {
    return false;
  }
  return OptionalData(d, "responseData", &out->response_data, error);
}

bool ParseRequest(const json& d, bool require_id, RequestMessage* out,
                  std::string* error) {
  if (!RequireString(d, "requestType", &out->request_type, error)) {
    return false;
  }
  if (require_id) {
    if (!RequireString(d, "requestId", &out->request_id, error)) {
      return false;
    }
  } else if (!OptionalString(d, "requestId", &out->request_id, error)) {
    return false;
  }
  return OptionalData(d, "requestData", &out->request_data, error);
}

// Parses the {"op", "d"} envelope.
bool ParseEnvelope(const std::string& text, int* op, json* d, std::string* error) {
  json frame = json::parse(text, nullptr, false);
  if (frame.is_discarded()) {
    return Fail(error, "invalid JSON");
  }
  if (!frame.is_object()) {
    return Fail(error, "frame is not a JSON object");
  }
  if (!RequireInt(frame, "op", op, error)) {
    return false;
  }
  const json* data = nullptr;
  if (!RequireObject(frame, "d", &data, error)) {
    return false;
  }
  *d = *data;
  return true;
}

std::string Base64(const unsigned char* data, size_t length) {
  std::string out(4 * ((length + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                      static_cast<int>(length));
  out.resize(written > 0 ? static_cast<size_t>(written) : 0);
  return out;
}

std::string Sha256Base64(const std::string& input) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha256(),
                 nullptr) != 1) {
    return {};
  }
  return Base64(digest, digest_len);
}

}  // namespace

std::string EncodeIdentify(const IdentifyMessage& message) {
  json d;
  d["rpcVersion"] = message.rpc_version;
  if (message.authentication.has_value()) {
    d["authentication"] = *message.authentication;
  }
  d["eventSubscriptions"] = message.event_subscriptions;
  return Frame(OpCode::kIdentify, std::move(d));
}

std::string EncodeReidentify(const ReidentifyMessage& message) {
  json d;
  d["eventSubscriptions"] = message.event_subscriptions;
  return Frame(OpCode::kReidentify, std::move(d));
}

std::string EncodeRequest(const RequestMessage& message) {
  return Frame(OpCode::kRequest, RequestToJson(message));
}

std::string EncodeRequestBatch(const RequestBatchMessage& message) {
  json d;
  d["requestId"] = message.request_id;
  d["haltOnFailure"] = message.halt_on_failure;
  json requests = json::array();
  for (const auto& request : message.requests) {
    requests.push_back(RequestToJson(request));
  }
  d["requests"] = std::move(requests);
  return Frame(OpCode::kRequestBatch, std::move(d));
}

std::string EncodeHello(const HelloMessage& message) {
  json d;
  d["obsWebSocketVersion"] = message.server_version;
  d["rpcVersion"] = message.rpc_version;
  if (message.authentication.has_value()) {
    d["authentication"] = {
        {"challenge", message.authentication->challenge},
        {"salt", message.authentication->salt},
    };
  }
  return Frame(OpCode::kHello, std::move(d));
}

std::string EncodeIdentified(const IdentifiedMessage& message) {
  json d;
  d["negotiatedRpcVersion"] = message.negotiated_rpc_version;
  return Frame(OpCode::kIdentified, std::move(d));
}

std::string EncodeEvent(const EventMessage& message) {
  json d;
  d["eventType"] = message.event_type;
  d["eventIntent"] = message.event_intent;
  if (message.event_data.is_object() && !message.event_data.empty()) {
    d["eventData"] = message.event_data;
  }
  return Frame(OpCode::kEvent, std::move(d));
}

std::string EncodeRequestResponse(const RequestResponseMessage& message) {
  return Frame(OpCode::kRequestResponse, ResponseToJson(message));
}

std::string EncodeRequestBatchResponse(const RequestBatchResponseMessage& message) {
  json d;
  d["requestId"] = message.request_id;
  json results = json::array();
  for (const auto& result : message.results) {
    results.push_back(ResponseToJson(result));
  }
  d["results"] = std::move(results);
  return Frame(OpCode::kRequestBatchResponse, std::move(d));
}

bool DecodeIncoming(const std::string& text, IncomingMessage* out, std::string* error) {
  int op = 0;
  json d;
  if (!ParseEnvelope(text, &op, &d, error)) {
    return false;
  }
  switch (op) {
    case static_cast<int>(OpCode::kHello): {
      HelloMessage hello;
      if (!RequireString(d, "obsWebSocketVersion", &hello.server_version, error) ||
          !RequireInt(d, "rpcVersion", &hello.rpc_version, error)) {
        return false;
      }
      auto auth = d.find("authentication");
      if (auth != d.end() && !auth->is_null()) {
        if (!auth->is_object()) {
          return Fail(error, "field 'authentication' must be an object");
        }
        AuthChallenge challenge;
        if (!RequireString(*auth, "challenge", &challenge.challenge, error) ||
            !RequireString(*auth, "salt", &challenge.salt, error)) {
          return false;
        }
        hello.authentication = std::move(challenge);
      }
      *out = std::move(hello);
      return true;
    }
    case static_cast<int>(OpCode::kIdentified): {
      IdentifiedMessage identified;
      if (!RequireInt(d, "negotiatedRpcVersion", &identified.negotiated_rpc_version,
                      error)) {
        return false;
      }
      *out = identified;
      return true;
    }
    case static_cast<int>(OpCode::kEvent): {
      EventMessage event;
      if (!RequireString(d, "eventType", &event.event_type, error) ||
          !OptionalMask(d, "eventIntent", &event.event_intent, error) ||
          !OptionalData(d, "eventData", &event.event_data, error)) {
        return false;
      }
      *out = std::move(event);
      return true;
    }
    case static_cast<int>(OpCode::kRequestResponse): {
      RequestResponseMessage response;
      if (!ParseResponse(d, true, &response, error)) {
        return false;
      }
      *out = std::move(response);
      return true;
    }
    case static_cast<int>(OpCode::kRequestBatchResponse): {
      RequestBatchResponseMessage batch;
      if (!RequireString(d, "requestId", &batch.request_id, error)) {
        return false;
      }
      auto results = d.find("results");
      if (results == d.end() || !results->is_array()) {
        return Fail(error, "missing or non-array field 'results'");
      }
      for (const auto& entry : *results) {
        if (!entry.is_object()) {
          return Fail(error, "batch result is not an object");
        }
        RequestResponseMessage response;
        if (!ParseResponse(entry, false, &response, error)) {
          return false;
        }
        batch.results.push_back(std::move(response));
      }
      *out = std::move(batch);
      return true;
    }
    case static_cast<int>(OpCode::kIdentify):
    case static_cast<int>(OpCode::kReidentify):
    case static_cast<int>(OpCode::kRequest):
    case static_cast<int>(OpCode::kRequestBatch): {
      std::ostringstream oss;
      oss << "client-only opcode " << op << " (" << OpCodeName(op) << ") received from server";
      return Fail(error, oss.str());
    }
    default:
      break;
  }
  UnknownMessage unknown;
  unknown.op = op;
  unknown.data = std::move(d);
  *out = std::move(unknown);
  return true;
}

bool DecodeOutgoing(const std::string& text, OutgoingMessage* out, std::string* error) {
  int op = 0;
  json d;
  if (!ParseEnvelope(text, &op, &d, error)) {
    return false;
  }
  switch (op) {
    case static_cast<int>(OpCode::kIdentify): {
      IdentifyMessage identify;
      if (!RequireInt(d, "rpcVersion", &identify.rpc_version, error)) {
        return false;
      }
      std::string auth;
      auto it = d.find("authentication");
      if (it != d.end() && !it->is_null()) {
        if (!OptionalString(d, "authentication", &auth, error)) {
          return false;
        }
        identify.authentication = auth;
      }
      if (!OptionalMask(d, "eventSubscriptions", &identify.event_subscriptions, error)) {
        return false;
      }
      *out = std::move(identify);
      return true;
    }
    case static_cast<int>(OpCode::kReidentify): {
      ReidentifyMessage reidentify;
      if (!OptionalMask(d, "eventSubscriptions", &reidentify.event_subscriptions, error)) {
        return false;
      }
      *out = reidentify;
      return true;
    }
    case static_cast<int>(OpCode::kRequest): {
      RequestMessage request;
      if (!ParseRequest(d, true, &request, error)) {
        return false;
      }
      *out = std::move(request);
      return true;
    }
    case static_cast<int>(OpCode::kRequestBatch): {
      RequestBatchMessage batch;
      if (!RequireString(d, "requestId", &batch.request_id, error) ||
          !OptionalBool(d, "haltOnFailure", &batch.halt_on_failure, error)) {
        return false;
      }
      auto requests = d.find("requests");
      if (requests == d.end() || !requests->is_array()) {
        return Fail(error, "missing or non-array field 'requests'");
      }
      for (const auto& entry : *requests) {
        if (!entry.is_object()) {
          return Fail(error, "batch request is not an object");
        }
        RequestMessage request;
        if (!ParseRequest(entry, false, &request, error)) {
          return false;
        }
        batch.requests.push_back(std::move(request));
      }
      *out = std::move(batch);
      return true;
    }
    default: {
      std::ostringstream oss;
      oss << "opcode " << op << " (" << OpCodeName(op) << ") is not a client message";
      return Fail(error, oss.str());
    }
  }
}

std::string ComputeAuthResponse(const std::string& password, const std::string& salt,
                                const std::string& challenge) {
  const std::string secret = Sha256Base64(password + salt);
  return Sha256Base64(secret + challenge);
}

const char* OpCodeName(int op) {
  switch (op) {
    case static_cast<int>(OpCode::kHello):
      return "Hello";
    case static_cast<int>(OpCode::kIdentify):
      return "Identify";
    case static_cast<int>(OpCode::kIdentified):
      return "Identified";
    case static_cast<int>(OpCode::kReidentify):
      return "Reidentify";
    case static_cast<int>(OpCode::kEvent):
      return "Event";
    case static_cast<int>(OpCode::kRequest):
      return "Request";
    case static_cast<int>(OpCode::kRequestResponse):
      return "RequestResponse";
    case static_cast<int>(OpCode::kRequestBatch):
      return "RequestBatch";
    case static_cast<int>(OpCode::kRequestBatchResponse):
      return "RequestBatchResponse";
    default:
      return "Unknown";
  }
}

}  // namespace replaycue
