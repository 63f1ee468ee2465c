// modules/signature/signature_store.cpp
#include "modules/signature/signature_store.h"
#include "core/types/errors.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <functional>

namespace agentkernel {

size_t SignatureStore::KeyHashCompare::hash(const Key& key) const {
    size_t h = std::hash<std::string>{}(key.run_id);
    // boost::hash_combine
    h ^= std::hash<std::string>{}(key.node_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

void SignatureStore::put(const RunId& run_id, const NodeId& node_id, Signature signature) {
    bool inserted = false;
    {
        EntryMap::accessor acc;
        inserted = entries_.insert(acc, Key{run_id, node_id});
        acc->second = std::move(signature);
    }
    if (inserted) {
        RunIndex::accessor acc;
        run_index_.insert(acc, run_id);
        acc->second.push_back(node_id);
    }
    logger()->debug("Signature stored: run={} node={}", run_id, node_id);
}

std::optional<Signature> SignatureStore::find(const RunId& run_id, const NodeId& node_id) const {
    EntryMap::const_accessor acc;
    if (!entries_.find(acc, Key{run_id, node_id})) {
        return std::nullopt;
    }
    return acc->second;
}

Signature SignatureStore::get(const RunId& run_id, const NodeId& node_id) const {
    auto signature = find(run_id, node_id);
    if (!signature) {
        throw SignatureNotFoundError(run_id, node_id);
    }
    return std::move(*signature);
}

std::map<NodeId, Signature> SignatureStore::get_inputs(const RunId& run_id,
                                                       const std::vector<NodeId>& dependency_ids) const {
    std::map<NodeId, Signature> inputs;
    for (const auto& dep : dependency_ids) {
        auto signature = find(run_id, dep);
        if (!signature) {
            throw MissingSignatureError(run_id, dep);
        }
        inputs.emplace(dep, std::move(*signature));
    }
    return inputs;
}

std::map<NodeId, Signature> SignatureStore::get_all(const RunId& run_id) const {
    std::vector<NodeId> node_ids;
    {
        RunIndex::const_accessor acc;
        if (!run_index_.find(acc, run_id)) {
            return {};
        }
        node_ids = acc->second;
    }
    std::map<NodeId, Signature> all;
    for (const auto& node_id : node_ids) {
        if (auto signature = find(run_id, node_id)) {
            all.emplace(node_id, std::move(*signature));
        }
    }
    return all;
}

size_t SignatureStore::purge(const RunId& run_id) {
    std::vector<NodeId> node_ids;
    {
        RunIndex::accessor acc;
        if (!run_index_.find(acc, run_id)) {
            return 0;
        }
        node_ids = std::move(acc->second);
        run_index_.erase(acc);
    }
    size_t removed = 0;
    for (const auto& node_id : node_ids) {
        if (entries_.erase(Key{run_id, node_id})) {
            ++removed;
        }
    }
    logger()->debug("Purged {} signatures of run {}", removed, run_id);
    return removed;
}

} // namespace agentkernel
