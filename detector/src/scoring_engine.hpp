#pragma once
#include "anomaly_publisher.hpp"
#include "anomaly_scorer.hpp"
#include "anomaly_sink.hpp"
#include "bar_store.hpp"
#include "config.hpp"
#include "universe_state.hpp"
#include "window_manager.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <thread>

enum class ScoreOutcome {
    Recorded,
    Duplicate,        // already scored
    BelowThreshold,   // composite is zero and the policy drops it
    InsufficientData, // fewer than W closed bars precede the bar
    Skipped,          // degraded instrument, or bar missing / still open
    Failed
};

const char* to_string(ScoreOutcome outcome);

struct PassSummary {
    size_t scored = 0;
    size_t recorded = 0;
    size_t deferred = 0; // left for the next pass when the budget ran out
    std::chrono::milliseconds elapsed{0};
};

// Scores newly finalized bars against their rolling window. Runs one thread
// that drains notifications and periodically rescans the active universe.
class ScoringEngine {
public:
    ScoringEngine(const Config& config,
                  BarStore& store,
                  AnomalySink& sink,
                  UniverseState& universe,
                  AnomalyPublisher* publisher = nullptr);
    ~ScoringEngine();

    ScoringEngine(const ScoringEngine&) = delete;
    ScoringEngine& operator=(const ScoringEngine&) = delete;

    // Thread-safe; duplicates collapse while queued
    void notify_finalized(const BarKey& key);

    // Score one finalized bar; repeated calls are no-ops once recorded
    ScoreOutcome score_bar(const BarKey& key);

    // Drain queued keys, plus the latest closed bar of every active instrument
    // when `rescan_active` is set, within the configured time budget
    PassSummary run_pass(bool rescan_active);

    void start();
    void stop();

    size_t pending() const;
    std::optional<std::chrono::system_clock::time_point> last_pass_time() const;

private:
    void run_loop();

    const Config& config_;
    BarStore& store_;
    AnomalySink& sink_;
    UniverseState& universe_;
    AnomalyPublisher* publisher_;
    WindowManager window_manager_;
    ScoringThresholds thresholds_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<BarKey> queue_;
    std::set<BarKey> queued_;

    mutable std::mutex pass_mutex_;
    std::optional<std::chrono::system_clock::time_point> last_pass_;

    std::atomic<bool> running_{false};
    std::thread worker_;
};
