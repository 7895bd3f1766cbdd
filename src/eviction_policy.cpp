#include "eviction_policy.h"

// PRECONDITION: node is in nodes_
void LfuPolicy::detach(const Node& node){
    auto bucket = buckets_.find(node.freq);
    bucket->second.erase(node.seq);
    if(bucket->second.empty()){
        buckets_.erase(bucket);
    }
}

void LfuPolicy::record_access(const std::string& key){
    auto it = nodes_.find(key);
    if(it == nodes_.end()){
        uint64_t seq = next_seq_++;
        buckets_[1].emplace(seq, key);
        nodes_.emplace(key, Node{1, seq});
        return;
    }

    // Existing key moves to the next bucket, keeping its insertion seq
    Node& node = it->second;
    detach(node);
    node.freq++;
    buckets_[node.freq].emplace(node.seq, key);
}

std::optional<std::string> LfuPolicy::evict_candidate() const{
    if(buckets_.empty()){
        return std::nullopt;
    }
    return buckets_.begin()->second.begin()->second;
}

void LfuPolicy::remove(const std::string& key){
    auto it = nodes_.find(key);
    if(it == nodes_.end()) return;
    detach(it->second);
    nodes_.erase(it);
}

bool LfuPolicy::contains(const std::string& key) const{
    return nodes_.find(key) != nodes_.end();
}

size_t LfuPolicy::size() const{
    return nodes_.size();
}

void LfuPolicy::clear(){
    nodes_.clear();
    buckets_.clear();
}

uint64_t LfuPolicy::frequency(const std::string& key) const{
    auto it = nodes_.find(key);
    return it == nodes_.end() ? 0 : it->second.freq;
}
