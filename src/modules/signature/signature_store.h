// modules/signature/signature_store.h
#ifndef AGENTKERNEL_MODULES_SIGNATURE_SIGNATURE_STORE_H
#define AGENTKERNEL_MODULES_SIGNATURE_SIGNATURE_STORE_H

#include "core/types/node.h" // 引入 RunId, NodeId, Signature
#include <tbb/concurrent_hash_map.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentkernel {

// Concurrent (run id, node id) -> thought signature map.
//
// Every key is guarded by its own bucket lock, so writes for distinct keys never
// contend and a reader racing a writer on the same key sees the whole old value
// or the whole new one. Entries live until purge(run_id).
class SignatureStore {
public:
    // Latest write wins
    void put(const RunId& run_id, const NodeId& node_id, Signature signature);

    // Throws SignatureNotFoundError
    Signature get(const RunId& run_id, const NodeId& node_id) const;
    std::optional<Signature> find(const RunId& run_id, const NodeId& node_id) const;

    // dependency id -> signature for every id in `dependency_ids`.
    // Throws MissingSignatureError naming the first dependency without one.
    std::map<NodeId, Signature> get_inputs(const RunId& run_id,
                                           const std::vector<NodeId>& dependency_ids) const;

    // All signatures written for a run so far (empty for an unknown run)
    std::map<NodeId, Signature> get_all(const RunId& run_id) const;

    // Drops every entry of the run, returns how many were removed
    size_t purge(const RunId& run_id);

    size_t size() const { return entries_.size(); }

private:
    struct Key {
        RunId run_id;
        NodeId node_id;
    };

    struct KeyHashCompare {
        size_t hash(const Key& key) const;
        bool equal(const Key& a, const Key& b) const {
            return a.run_id == b.run_id && a.node_id == b.node_id;
        }
    };

    using EntryMap = tbb::concurrent_hash_map<Key, Signature, KeyHashCompare>;
    using RunIndex = tbb::concurrent_hash_map<RunId, std::vector<NodeId>>;

    EntryMap entries_;
    RunIndex run_index_; // run -> node ids that wrote, for get_all / purge
};

} // namespace agentkernel

#endif // AGENTKERNEL_MODULES_SIGNATURE_SIGNATURE_STORE_H
