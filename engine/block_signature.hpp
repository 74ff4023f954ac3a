#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "transform_engine.hpp"

struct BlockInfo {
    uint64_t offset;            // Offset in the basis file
    uint32_t weakHash;          // Rolling hash
    std::string strongHash;     // truncated SHA-1 or BLAKE2b

    BlockInfo(uint64_t o, uint32_t w, std::string s)
        : offset(o), weakHash(w), strongHash(std::move(s)) {}
};

struct PairHash {
    template <class T1, class T2>
    std::size_t operator () (const std::pair<T1, T2>& p) const {
        auto h1 = std::hash<T1>{}(p.first);
        auto h2 = std::hash<T2>{}(p.second);
        return h1 ^ (h2 << 1);
    }
};

class BlockSignature : public Signature {
public:
    BlockSignature(SignatureFormat format, size_t blockLength, size_t strongLength);

    SignatureFormat format() const override { return format_; }
    size_t blockLength() const override { return blockLength_; }
    size_t strongLength() const override { return strongLength_; }
    size_t blockCount() const override { return blocks_.size(); }
    bool hashTableBuilt() const override { return built_; }

    void addBlock(uint32_t weakHash, std::string strongHash);
    const std::vector<BlockInfo>& blocks() const { return blocks_; }

    void buildHashTable();
    // basis offset of a block whose content is data[0, length), the first one wins on duplicates
    std::optional<uint64_t> findBlock(uint32_t weakHash, const char* data, size_t length) const;

private:
    SignatureFormat format_;
    size_t blockLength_;
    size_t strongLength_;
    std::vector<BlockInfo> blocks_;
    std::unordered_set<uint32_t> weakHashSet_;
    std::unordered_map<std::pair<uint32_t, std::string>, uint64_t, PairHash> hashToOffset_;
    bool built_ = false;
};
