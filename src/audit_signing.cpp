#include "audit_signing.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace hilo {

namespace {

void ensureSodium() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
}

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex input must have even length");
    }
    std::vector<unsigned char> out(hex.size() / 2);
    std::size_t written = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &written, nullptr) != 0 ||
        written != out.size()) {
        throw std::invalid_argument("hex input is malformed");
    }
    return out;
}

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

void wipe(std::vector<unsigned char>& bytes) {
    if (!bytes.empty()) {
        sodium_memzero(bytes.data(), bytes.size());
    }
}

SigningKeyPair toKeyPair(const std::vector<unsigned char>& pk, std::vector<unsigned char>& sk) {
    SigningKeyPair out;
    out.publicKeyHex = bytesToHex(pk.data(), pk.size());
    out.secretKeyHex = bytesToHex(sk.data(), sk.size());
    wipe(sk);
    return out;
}

} // namespace

SigningKeyPair generateSigningKeyPair() {
    ensureSodium();
    std::vector<unsigned char> pk(crypto_sign_PUBLICKEYBYTES);
    std::vector<unsigned char> sk(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_keypair(pk.data(), sk.data()) != 0) {
        throw std::runtime_error("Ed25519 key generation failed");
    }
    return toKeyPair(pk, sk);
}

SigningKeyPair deriveSigningKeyPair(const std::string& seedHex) {
    ensureSodium();
    auto seed = hexToBytes(seedHex);
    if (seed.size() != crypto_sign_SEEDBYTES) {
        wipe(seed);
        throw std::invalid_argument("signing seed must be 32 bytes");
    }
    std::vector<unsigned char> pk(crypto_sign_PUBLICKEYBYTES);
    std::vector<unsigned char> sk(crypto_sign_SECRETKEYBYTES);
    int rc = crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data());
    wipe(seed);
    if (rc != 0) {
        throw std::runtime_error("Ed25519 seed derivation failed");
    }
    return toKeyPair(pk, sk);
}

std::string publicKeyFromSecret(const std::string& secretKeyHex) {
    ensureSodium();
    auto sk = hexToBytes(secretKeyHex);
    if (sk.size() != crypto_sign_SECRETKEYBYTES) {
        wipe(sk);
        throw std::invalid_argument("secret key must be 64 bytes");
    }
    std::vector<unsigned char> pk(crypto_sign_PUBLICKEYBYTES);
    int rc = crypto_sign_ed25519_sk_to_pk(pk.data(), sk.data());
    wipe(sk);
    if (rc != 0) {
        throw std::runtime_error("Unable to derive public key from secret key");
    }
    return bytesToHex(pk.data(), pk.size());
}

std::string auditRootMessage(const std::string& deploymentId,
                             const std::string& chainId,
                             RoundId round,
                             const std::string& merkleRoot) {
    std::string message = deploymentId + ":";
    if (!chainId.empty()) {
        message += chainId + ":";
    }
    message += std::to_string(round) + ":" + merkleRoot;
    return message;
}

std::string signAuditRoot(const std::string& message, const std::string& secretKeyHex) {
    ensureSodium();
    auto sk = hexToBytes(secretKeyHex);
    if (sk.size() != crypto_sign_SECRETKEYBYTES) {
        wipe(sk);
        throw std::invalid_argument("secret key must be 64 bytes");
    }
    std::vector<unsigned char> signature(crypto_sign_BYTES);
    unsigned long long sigLen = 0;
    int rc = crypto_sign_detached(signature.data(),
                                  &sigLen,
                                  reinterpret_cast<const unsigned char*>(message.data()),
                                  message.size(),
                                  sk.data());
    wipe(sk);
    if (rc != 0) {
        throw std::runtime_error("Signing failed");
    }
    return bytesToHex(signature.data(), static_cast<std::size_t>(sigLen));
}

bool verifyAuditRoot(const std::string& message,
                     const std::string& signatureHex,
                     const std::string& publicKeyHex) {
    ensureSodium();
    std::vector<unsigned char> signature;
    std::vector<unsigned char> pk;
    try {
        signature = hexToBytes(signatureHex);
        pk = hexToBytes(publicKeyHex);
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (signature.size() != crypto_sign_BYTES || pk.size() != crypto_sign_PUBLICKEYBYTES) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       pk.data()) == 0;
}

} // namespace hilo
