#pragma once

#include "events.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace hilo {

// Append-only log of encoded market events. Leaves are SHA-256 hex digests of
// encodeEvent(); odd layers duplicate their last node when folding.
class AuditLog {
public:
    void append(const MarketEvent& event);
    void appendRaw(const std::string& encoded);

    std::string getLeaf(std::size_t index) const;
    const std::vector<std::string>& leaves() const { return leaves_; }
    std::size_t size() const { return leaves_.size(); }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const std::string& leafHash,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    static std::string hash(const std::string& data);

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> leaves_;
};

} // namespace hilo
