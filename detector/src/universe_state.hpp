#pragma once
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

struct UniverseDiff {
    std::vector<std::string> added;
    std::vector<std::string> removed;

    bool empty() const { return added.empty() && removed.empty(); }
};

// Service-scoped view of the active instruments, shared by reference between
// the selector, the ingestion pipeline and the scoring engine.
class UniverseState {
public:
    // Replace the active set (ordered by rank) and return what changed
    UniverseDiff replace(const std::vector<std::string>& instruments);
    void update_volumes(const std::unordered_map<std::string, double>& quote_volumes_24h);

    std::vector<std::string> active() const;
    bool is_active(const std::string& instrument) const;
    size_t size() const;

    // Detection is skipped for degraded instruments until backfill succeeds
    void mark_degraded(const std::string& instrument);
    void clear_degraded(const std::string& instrument);
    bool is_degraded(const std::string& instrument) const;
    std::vector<std::string> degraded() const;
    size_t degraded_count() const;

    // 24h quote volume from the latest snapshot, 0 when unknown
    double quote_volume_24h(const std::string& instrument) const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> active_;
    std::set<std::string> degraded_;
    std::unordered_map<std::string, double> quote_volumes_;
};
