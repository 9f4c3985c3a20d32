#include "trustchain/session.hpp"

#include "trustchain/crypto.hpp"
#include "trustchain/logging.hpp"
#include "trustchain/time_util.hpp"

namespace trustchain {

namespace {

std::shared_ptr<ExternalSignerBridge> makeSigner(
    const TrustChainConfig& config, std::shared_ptr<HttpClient> http) {
  if (!config.external_signer) {
    return nullptr;
  }
  if (!http) {
    http = defaultHttpClient();
  }
  return std::make_shared<ExternalSignerBridge>(*config.external_signer,
                                                std::move(http));
}

}  // namespace

std::unique_ptr<Session> Session::create(TrustChainConfig config,
                                         std::shared_ptr<HttpClient> http) {
  logging::Logger::getInstance().setLogLevel(config.log_level);
  return std::unique_ptr<Session>(
      new Session(std::move(config), std::move(http)));
}

Session::Session(TrustChainConfig config, std::shared_ptr<HttpClient> http)
    : config_(std::move(config)),
      signer_(makeSigner(config_, std::move(http))),
      keys_(config_.strict_mode, signer_),
      audit_(config_.audit_visible_limit),
      signing_(keys_, audit_, config_.agent_id, config_.tier),
      verification_(&keys_) {
  startSessionLocked();
}

void Session::startSessionLocked() {
  std::string id = "sess_" + randomHex(16);
  signing_.reset(id, formatRfc3339(Clock::now()));
  active_ = true;
  TC_LOG_INFO("New session {} for agent {}", id, config_.agent_id);
}

std::string Session::startSession() {
  std::lock_guard<std::mutex> lock(mutex_);
  startSessionLocked();
  return signing_.sessionId();
}

SessionInfo Session::infoLocked() const {
  SessionInfo info;
  info.session_id = signing_.sessionId();
  info.agent_id = signing_.agentId();
  info.started_at = signing_.startedAt();
  info.sequence = signing_.sequence();
  info.total_calls = signing_.totalCalls();
  info.tier = signing_.tier();
  info.chain_length = audit_.chainLength();
  return info;
}

SessionInfo Session::endSession() {
  std::lock_guard<std::mutex> lock(mutex_);
  SessionInfo info = infoLocked();
  active_ = false;
  TC_LOG_INFO("Session {} ended after {} calls", info.session_id,
              info.total_calls);
  return info;
}

Envelope Session::sign(std::string_view toolName, const nlohmann::json& args) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!active_) {
    startSessionLocked();
  }
  return signing_.sign(toolName, args);
}

FinalResponseProof Session::signFinalResponse(
    std::string_view responseText,
    const std::vector<std::string>& toolSignatures,
    const nlohmann::json& extraContext) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!active_) {
    startSessionLocked();
  }
  return signing_.signFinalResponse(responseText, toolSignatures,
                                    extraContext);
}

bool Session::verify(const Envelope& envelope, std::string_view toolName,
                     const nlohmann::json& args) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return verification_.verify(envelope, toolName, args);
}

bool Session::verifyFinalResponse(
    const FinalResponseProof& proof, std::string_view responseText,
    const std::vector<std::string>& toolSignatures) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return verification_.verifyFinalResponse(proof, responseText,
                                           toolSignatures);
}

void Session::setCurrentQuery(std::string query) {
  std::lock_guard<std::mutex> lock(mutex_);
  signing_.setCurrentQuery(std::move(query));
}

void Session::setTier(Tier tier) {
  std::lock_guard<std::mutex> lock(mutex_);
  signing_.setTier(tier);
}

void Session::setDecisionContext(std::optional<nlohmann::json> context) {
  std::lock_guard<std::mutex> lock(mutex_);
  signing_.setDecisionContext(std::move(context));
}

void Session::setExecutionContext(std::optional<ExecutionContext> context) {
  std::lock_guard<std::mutex> lock(mutex_);
  signing_.setExecutionContext(std::move(context));
}

void Session::setTenantId(std::optional<std::string> tenantId) {
  std::lock_guard<std::mutex> lock(mutex_);
  signing_.setTenantId(std::move(tenantId));
}

SessionInfo Session::sessionInfo() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return infoLocked();
}

std::vector<AuditEntry> Session::auditTrail() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return audit_.entries(signing_.tier());
}

nlohmann::json Session::exportAuditTrail() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return audit_.toJson();
}

bool Session::chainIntegrity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return audit_.chainIntegrity();
}

std::optional<nlohmann::json> Session::exportComplianceReport() const {
  std::lock_guard<std::mutex> lock(mutex_);
  ComplianceContext context;
  context.agent_id = signing_.agentId();
  context.session_id = signing_.sessionId();
  context.tier = signing_.tier();
  context.algorithm = keys_.algorithm();
  context.public_key = keys_.publicKeyBase64();
  context.compliance_markers = signing_.certificate().compliance;
  return audit_.exportComplianceReport(context);
}

void Session::rotateKey() {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.rotateKey();
}

void Session::revokeKey(std::string_view keyId) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.revoke(keyId);
}

KeyInfo Session::keyInfo() {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.initialize();
  return keys_.keyInfo();
}

std::optional<ExternalSignerHealth> Session::signerHealth(bool force) {
  if (!signer_) {
    return std::nullopt;
  }
  return signer_->healthCheck(force);
}

}  // namespace trustchain
