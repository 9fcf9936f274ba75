#include "audit_signing.hpp"
#include "errors.hpp"
#include "market_config.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace {

void writeJson(const std::string& path, const std::string& jsonPayload) {
    if (path.empty()) {
        std::cout << jsonPayload;
        return;
    }
    std::ofstream ofs(path);
    if (!ofs) {
        throw std::runtime_error("Unable to open output path: " + path);
    }
    ofs << jsonPayload;
}

int printKeyPair(int argc, char* argv[]) {
    hilo::SigningKeyPair keys =
        argc >= 3 ? hilo::deriveSigningKeyPair(argv[2]) : hilo::generateSigningKeyPair();
    std::cout << "{\n";
    std::cout << "  \"public_key\": \"" << keys.publicKeyHex << "\",\n";
    std::cout << "  \"secret_key\": \"" << keys.secretKeyHex << "\"\n";
    std::cout << "}\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        hilo::configureLogging();
    } catch (const hilo::MarketError& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    if (argc >= 2 && std::string(argv[1]) == "keygen") {
        try {
            return printKeyPair(argc, argv);
        } catch (const std::exception& ex) {
            std::cerr << ex.what() << "\n";
            return 1;
        }
    }

    if (argc < 4) {
        std::cerr << "Usage: hilo_publish_root <round> <merkle_root> <secret_key_hex> [output.json]\n";
        std::cerr << "       hilo_publish_root keygen [seed_hex]\n";
        std::cerr << "Environment: HILO_DEPLOYMENT_ID is required; optional HILO_CHAIN_ID adds chain scoping.\n";
        return 1;
    }

    std::uint64_t round = 0;
    try {
        round = hilo::parseUnsigned("round", argv[1]);
    } catch (const hilo::MarketError& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }
    std::string merkleRoot = argv[2];
    std::string secretKeyHex = argv[3];
    std::string outputPath;
    if (argc >= 5) {
        outputPath = argv[4];
    }

    std::string deploymentId;
    std::string chainId;
    try {
        deploymentId = hilo::resolveDeploymentId();
        chainId = hilo::resolveChainId();
    } catch (const hilo::MarketError& ex) {
        std::cerr << ex.what() << "; refusing to sign\n";
        return 1;
    }

    std::string signature;
    std::string publicKey;
    const std::string message = hilo::auditRootMessage(deploymentId, chainId, round, merkleRoot);
    try {
        publicKey = hilo::publicKeyFromSecret(secretKeyHex);
        signature = hilo::signAuditRoot(message, secretKeyHex);
    } catch (const std::exception& ex) {
        std::cerr << "Signing failed: " << ex.what() << "\n";
        return 1;
    }
    spdlog::info("signed audit root for round {} under {}", round, deploymentId);

    std::ostringstream json;
    json << "{\n";
    json << "  \"round\": " << round << ",\n";
    json << "  \"merkle_root\": \"" << merkleRoot << "\",\n";
    json << "  \"deployment_id\": \"" << deploymentId << "\"";
    if (!chainId.empty()) {
        json << ",\n  \"chain_id\": \"" << chainId << "\"";
    }
    json << ",\n  \"message\": \"" << message << "\",\n";
    json << "  \"signature\": \"" << signature << "\",\n";
    json << "  \"public_key\": \"" << publicKey << "\"\n";
    json << "}\n";

    try {
        writeJson(outputPath, json.str());
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }
    return 0;
}
