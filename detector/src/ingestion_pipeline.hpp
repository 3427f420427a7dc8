#pragma once
#include "backoff_manager.hpp"
#include "bar_feed.hpp"
#include "bar_store.hpp"
#include "bounded_queue.hpp"
#include "config.hpp"
#include "market_data_client.hpp"
#include "universe_state.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

enum class BackfillOutcome {
    NotNeeded, // window already covered
    Completed,
    Degraded,  // retries exhausted
    Aborted    // pipeline stopping
};

struct IngestionStats {
    uint64_t updates_applied = 0;
    uint64_t bars_finalized = 0;
    uint64_t rejected_final = 0;
    uint64_t malformed = 0;
    uint64_t store_failures = 0;
    uint64_t backfilled_bars = 0;
};

// Keeps one live subscription per active instrument and writes every update
// into the Bar Store. Each subscription runs a producer thread (feed plus
// reconnect backoff) and a consumer thread draining a bounded queue.
class IngestionPipeline {
public:
    using FinalizedHandler = std::function<void(const BarKey&)>;

    IngestionPipeline(const Config& config,
                      BarStore& store,
                      UniverseState& universe,
                      MarketDataClient& client,
                      BarFeedFactory feed_factory);
    ~IngestionPipeline();

    IngestionPipeline(const IngestionPipeline&) = delete;
    IngestionPipeline& operator=(const IngestionPipeline&) = delete;

    // Called for every bar that this pipeline turned final
    void set_finalized_handler(FinalizedHandler handler);

    // Subscribe additions, release removals, retry degraded backfills
    void apply_universe(const UniverseDiff& diff);

    void subscribe(const std::string& instrument);
    void unsubscribe(const std::string& instrument);
    bool is_subscribed(const std::string& instrument) const;
    size_t subscription_count() const;

    // Validate and upsert one update; empty when discarded as malformed
    std::optional<UpsertResult> handle_update(const BarUpdate& update, const std::string& instrument);

    // Fill the window from the batch endpoint when fewer than W closed bars exist.
    // Attempts stop as soon as `active` or the pipeline flag clears.
    BackfillOutcome backfill(const std::string& instrument, const std::atomic<bool>& active);

    // Start one background backfill per degraded subscription; does not wait for them
    void retry_degraded();

    IngestionStats stats() const;

    // Stop new subscriptions, close queues, join every thread
    void stop();

private:
    struct Subscription {
        explicit Subscription(const std::string& name, size_t capacity)
            : instrument(name), queue(capacity) {}

        std::string instrument;
        std::atomic<bool> running{true};
        std::atomic<bool> retrying{false};
        BoundedQueue<BarUpdate> queue;
        std::thread producer;
        std::thread consumer;
        std::thread retry;
    };

    void produce(Subscription& sub);
    void consume(Subscription& sub);
    bool is_well_formed(const BarUpdate& update, const std::string& instrument) const;
    bool sleep_while(const std::atomic<bool>& flag, std::chrono::milliseconds duration) const;
    static void release(std::vector<std::unique_ptr<Subscription>>& subs);

    const Config& config_;
    BarStore& store_;
    UniverseState& universe_;
    MarketDataClient& client_;
    BarFeedFactory feed_factory_;
    BackoffManager backoff_;
    FinalizedHandler on_finalized_;

    std::atomic<bool> running_{true};
    mutable std::mutex subscriptions_mutex_;
    std::map<std::string, std::unique_ptr<Subscription>> subscriptions_;

    std::atomic<uint64_t> updates_applied_{0};
    std::atomic<uint64_t> bars_finalized_{0};
    std::atomic<uint64_t> rejected_final_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> store_failures_{0};
    std::atomic<uint64_t> backfilled_bars_{0};
};
