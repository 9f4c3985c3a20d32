#include "trustchain/verification_engine.hpp"

#include "trustchain/base64.hpp"
#include "trustchain/canonical_json.hpp"
#include "trustchain/crypto.hpp"
#include "trustchain/logging.hpp"
#include "trustchain/signing_engine.hpp"

namespace trustchain {

bool VerificationEngine::verify(const Envelope& envelope,
                                std::string_view toolName,
                                const nlohmann::json& args) const noexcept {
  try {
    if (envelope.signature_schema_version != SIGNATURE_SCHEMA_VERSION) {
      TC_LOG_DEBUG("Unsupported signature schema version {}",
                   envelope.signature_schema_version);
      return false;
    }
    auto parts = splitSignature(envelope.signature);
    if (!parts || parts->first != envelope.algorithm) {
      return false;
    }

    auto payload = buildSigningPayload(
        toolName, args, envelope.sequence, envelope.timestamp,
        envelope.key_id, envelope.signature_schema_version,
        envelope.tenant_id, envelope.execution_context);
    const auto bytes = canonicalBytes(payload);

    switch (envelope.algorithm) {
      case SignatureAlgorithm::Ed25519: {
        auto publicKey = base64Decode(envelope.public_key);
        auto signature = base64Decode(parts->second);
        return verifyEd25519(publicKey, bytes, signature);
      }
      case SignatureAlgorithm::HmacSha256:
        return keys_ != nullptr && keys_->verifyLocal(bytes, envelope.signature);
    }
    return false;
  } catch (const std::exception& e) {
    TC_LOG_DEBUG("Envelope verification failed: {}", e.what());
    return false;
  }
}

bool VerificationEngine::verifyFinalResponse(
    const FinalResponseProof& proof, std::string_view responseText,
    const std::vector<std::string>& toolSignatures) const noexcept {
  try {
    if (proof.response_hash != sha256Hex(responseText) ||
        proof.tool_signatures_hash != toolSignaturesHash(toolSignatures) ||
        proof.tool_signature_count != toolSignatures.size()) {
      return false;
    }
    return verify(proof.envelope, FINAL_RESPONSE_TOOL,
                  finalResponseArguments(proof.response_hash,
                                         proof.tool_signatures_hash,
                                         proof.tool_signature_count,
                                         proof.context));
  } catch (const std::exception& e) {
    TC_LOG_DEBUG("Final response verification failed: {}", e.what());
    return false;
  }
}

}  // namespace trustchain
