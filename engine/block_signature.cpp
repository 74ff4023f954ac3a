#include "block_signature.hpp"
#include "hash_utils.hpp"

BlockSignature::BlockSignature(SignatureFormat format, size_t blockLength, size_t strongLength)
    : format_(format), blockLength_(blockLength), strongLength_(strongLength) {}

void BlockSignature::addBlock(uint32_t weakHash, std::string strongHash) {
    uint64_t offset = static_cast<uint64_t>(blocks_.size()) * blockLength_;
    blocks_.emplace_back(offset, weakHash, std::move(strongHash));
}

void BlockSignature::buildHashTable() {
    hashToOffset_.clear();
    weakHashSet_.clear();
    hashToOffset_.reserve(blocks_.size());
    for (const BlockInfo& block : blocks_) {
        hashToOffset_.emplace(std::make_pair(block.weakHash, block.strongHash), block.offset);
        weakHashSet_.insert(block.weakHash);
    }
    built_ = true;
}

std::optional<uint64_t> BlockSignature::findBlock(uint32_t weakHash, const char* data, size_t length) const {
    if (weakHashSet_.find(weakHash) == weakHashSet_.end()) {
        return std::nullopt;
    }
    // weak hash matches something, confirm with the strong hash
    std::string strong = HashUtils::computeStrongHash(format_, data, length, strongLength_);
    if (strong.empty()) return std::nullopt;
    auto it = hashToOffset_.find({weakHash, strong});
    if (it == hashToOffset_.end()) return std::nullopt;
    return it->second;
}
