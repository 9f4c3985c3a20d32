/**
 * @file tool_call_gateway.hpp
 * @brief Caller side of a remote tool call: trust gate, signing, dispatch
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

#include "http_client.hpp"
#include "policy_evaluator.hpp"
#include "session.hpp"

namespace trustchain {

/**
 * @brief Delivers a JSON-RPC request to a tool server
 */
class ToolTransport {
 public:
  virtual ~ToolTransport() = default;

  /**
   * @return The JSON-RPC response
   * @throws IoError if no response was received
   */
  virtual nlohmann::json send(const ServerConfig& server,
                              const nlohmann::json& request) = 0;
};

/**
 * @brief POSTs requests to ServerConfig::url
 */
class HttpToolTransport final : public ToolTransport {
 public:
  HttpToolTransport(std::shared_ptr<HttpClient> http,
                    std::chrono::milliseconds timeout);

  nlohmann::json send(const ServerConfig& server,
                      const nlohmann::json& request) override;

 private:
  std::shared_ptr<HttpClient> http_;
  std::chrono::milliseconds timeout_;
};

/**
 * @brief Denial carried by a JSON-RPC response, either as an "error" member
 * or inside the result
 */
std::optional<PolicyDenial> responseDenial(const nlohmann::json& response);

/**
 * @brief Runs one tools/call end to end
 *
 * 1. evaluate trust for the server and tool; deny -> UntrustedServerError
 * 2. sign the call and attach the envelope under "trustchain"
 * 3. dispatch and inspect the response for a denial
 * 4. on a signature-class denial of a read-only loopback call with the
 *    fallback enabled, resend unsigned and mark the result; otherwise
 *    PolicyDeniedError
 */
class ToolCallGateway {
 public:
  ToolCallGateway(Session& session, PolicyEvaluator& policy,
                  std::shared_ptr<ToolTransport> transport);

  /**
   * @return The call result ("result" member of the response, or the whole
   * response when there is none)
   * @throws UntrustedServerError, PolicyDeniedError, and signing errors
   */
  nlohmann::json call(const ServerConfig& server, std::string_view toolName,
                      const nlohmann::json& args);

 private:
  nlohmann::json makeRequest(std::string_view toolName,
                             const nlohmann::json& args);

  Session& session_;
  PolicyEvaluator& policy_;
  std::shared_ptr<ToolTransport> transport_;
  std::atomic<uint64_t> next_id_{1};
};

}  // namespace trustchain
