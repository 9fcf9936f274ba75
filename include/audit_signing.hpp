#pragma once

#include "betting.hpp"

#include <string>

namespace hilo {

struct SigningKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

// Ed25519 keys. The seed variant is deterministic (32-byte hex seed).
SigningKeyPair generateSigningKeyPair();
SigningKeyPair deriveSigningKeyPair(const std::string& seedHex);
std::string publicKeyFromSecret(const std::string& secretKeyHex);

// "deploymentId[:chainId]:round:root"
std::string auditRootMessage(const std::string& deploymentId,
                             const std::string& chainId,
                             RoundId round,
                             const std::string& merkleRoot);

std::string signAuditRoot(const std::string& message, const std::string& secretKeyHex);
bool verifyAuditRoot(const std::string& message,
                     const std::string& signatureHex,
                     const std::string& publicKeyHex);

} // namespace hilo
