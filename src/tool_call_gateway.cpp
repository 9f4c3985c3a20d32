#include "trustchain/tool_call_gateway.hpp"

#include "trustchain/error.hpp"
#include "trustchain/logging.hpp"

namespace trustchain {

using json = nlohmann::json;

HttpToolTransport::HttpToolTransport(std::shared_ptr<HttpClient> http,
                                     std::chrono::milliseconds timeout)
    : http_(std::move(http)), timeout_(timeout) {
  if (!http_) {
    throw ConfigurationError("tool transport needs an HTTP client");
  }
}

json HttpToolTransport::send(const ServerConfig& server, const json& request) {
  HttpError error;
  auto response = http_->postJson(server.url, request.dump(), timeout_, error);
  if (!response) {
    throw IoError("tool server '" + server.id + "' unreachable: " +
                  error.message);
  }

  auto body = json::parse(response->body, nullptr, false);
  if (body.is_discarded()) {
    if (response->ok()) {
      throw IoError("tool server '" + server.id + "' returned malformed JSON");
    }
    return json{{"jsonrpc", "2.0"},
                {"id", request.value("id", json())},
                {"error",
                 {{"code", "HTTP_" + std::to_string(response->status)},
                  {"message", response->body}}}};
  }
  return body;
}

std::optional<PolicyDenial> responseDenial(const json& response) {
  if (response.is_object()) {
    auto error = response.find("error");
    if (error != response.end() && !error->is_null()) {
      PolicyDenial denial;
      denial.code = std::string(deny_codes::POLICY_DENIED);
      if (error->is_object()) {
        // JSON-RPC puts numeric codes in "code" and ours in data.code
        auto data = error->find("data");
        if (data != error->end() && data->is_object() &&
            data->contains("code") && (*data)["code"].is_string()) {
          denial.code = (*data)["code"].get<std::string>();
        } else if (error->contains("code") && (*error)["code"].is_string()) {
          denial.code = (*error)["code"].get<std::string>();
        }
        denial.message = error->value("message", std::string());
      } else if (error->is_string()) {
        denial.message = error->get<std::string>();
      }
      return denial;
    }
    auto result = response.find("result");
    if (result != response.end()) {
      return extractPolicyDenial(*result);
    }
  }
  return extractPolicyDenial(response);
}

ToolCallGateway::ToolCallGateway(Session& session, PolicyEvaluator& policy,
                                 std::shared_ptr<ToolTransport> transport)
    : session_(session), policy_(policy), transport_(std::move(transport)) {
  if (!transport_) {
    throw ConfigurationError("gateway needs a tool transport");
  }
}

json ToolCallGateway::makeRequest(std::string_view toolName, const json& args) {
  return json{{"jsonrpc", "2.0"},
              {"method", "tools/call"},
              {"params", {{"name", toolName}, {"arguments", args}}},
              {"id", next_id_++}};
}

json ToolCallGateway::call(const ServerConfig& server,
                           std::string_view toolName, const json& args) {
  policy_.enforce(server, toolName);
  TC_LOG_DEBUG("Calling {} on {}", toolName, server.id);

  auto envelope = session_.sign(toolName, args);
  auto request = attachEnvelope(makeRequest(toolName, args), envelope);
  auto response = transport_->send(server, request);

  auto denial = responseDenial(response);
  if (!denial) {
    return response.contains("result") ? response["result"] : response;
  }

  if (!policy_.shouldAllowUnsignedReadFallback(server, toolName, denial->code,
                                               denial->message)) {
    TC_LOG_WARN("{} on {} denied: {} {}", toolName, server.id, denial->code,
                denial->message);
    throw PolicyDeniedError(denial->code, denial->message);
  }

  TC_LOG_WARN("Retrying {} on {} unsigned after {}", toolName, server.id,
              denial->code);
  auto retry = transport_->send(server, makeRequest(toolName, args));
  if (auto again = responseDenial(retry)) {
    throw PolicyDeniedError(again->code, again->message);
  }
  json result = retry.contains("result") ? retry["result"] : retry;
  return markUnsignedFallback(std::move(result),
                              denial->code + ": " + denial->message);
}

}  // namespace trustchain
