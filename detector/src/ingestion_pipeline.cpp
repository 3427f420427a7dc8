#include "ingestion_pipeline.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

std::string feed_key(const std::string& instrument) { return "feed:" + instrument; }
std::string backfill_key(const std::string& instrument) { return "backfill:" + instrument; }

} // namespace

IngestionPipeline::IngestionPipeline(const Config& config,
                                     BarStore& store,
                                     UniverseState& universe,
                                     MarketDataClient& client,
                                     BarFeedFactory feed_factory)
    : config_(config),
      store_(store),
      universe_(universe),
      client_(client),
      feed_factory_(std::move(feed_factory)),
      backoff_(config.base_backoff_seconds, config.max_backoff_seconds) {
}

IngestionPipeline::~IngestionPipeline() {
    stop();
}

void IngestionPipeline::set_finalized_handler(FinalizedHandler handler) {
    on_finalized_ = std::move(handler);
}

void IngestionPipeline::apply_universe(const UniverseDiff& diff) {
    std::vector<std::unique_ptr<Subscription>> released;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (const auto& instrument : diff.removed) {
            auto it = subscriptions_.find(instrument);
            if (it == subscriptions_.end()) continue;
            released.push_back(std::move(it->second));
            subscriptions_.erase(it);
        }
    }
    // Existing bars are kept; retention ages them out
    release(released);
    for (const auto& instrument : diff.removed) {
        universe_.clear_degraded(instrument);
        backoff_.forget(feed_key(instrument));
        backoff_.forget(backfill_key(instrument));
    }

    for (const auto& instrument : diff.added) {
        subscribe(instrument);
    }

    retry_degraded();
}

void IngestionPipeline::subscribe(const std::string& instrument) {
    if (!running_) {
        return;
    }

    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    if (subscriptions_.count(instrument)) {
        return;
    }

    auto sub = std::make_unique<Subscription>(instrument, static_cast<size_t>(config_.feed_queue_capacity));
    Subscription* raw = sub.get();
    sub->consumer = std::thread([this, raw]() { consume(*raw); });
    sub->producer = std::thread([this, raw]() { produce(*raw); });
    subscriptions_.emplace(instrument, std::move(sub));

    spdlog::info("Subscribed to {} {}", instrument, config_.bar_interval);
}

void IngestionPipeline::unsubscribe(const std::string& instrument) {
    std::vector<std::unique_ptr<Subscription>> released;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        auto it = subscriptions_.find(instrument);
        if (it == subscriptions_.end()) return;
        released.push_back(std::move(it->second));
        subscriptions_.erase(it);
    }
    release(released);
}

bool IngestionPipeline::is_subscribed(const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return subscriptions_.count(instrument) > 0;
}

size_t IngestionPipeline::subscription_count() const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return subscriptions_.size();
}

void IngestionPipeline::release(std::vector<std::unique_ptr<Subscription>>& subs) {
    // Signal everyone first so the joins overlap
    for (auto& sub : subs) {
        sub->running = false;
        sub->queue.close();
    }
    for (auto& sub : subs) {
        if (sub->producer.joinable()) sub->producer.join();
        if (sub->consumer.joinable()) sub->consumer.join();
        if (sub->retry.joinable()) sub->retry.join();
        spdlog::info("Unsubscribed from {}", sub->instrument);
    }
    subs.clear();
}

void IngestionPipeline::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::vector<std::unique_ptr<Subscription>> released;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (auto& entry : subscriptions_) {
            released.push_back(std::move(entry.second));
        }
        subscriptions_.clear();
    }
    spdlog::info("Stopping {} subscriptions...", released.size());
    release(released);
    spdlog::info("Ingestion pipeline stopped");
}

void IngestionPipeline::produce(Subscription& sub) {
    const std::string key = feed_key(sub.instrument);

    while (sub.running && running_) {
        // Covers the first subscription and every reconnect
        if (backfill(sub.instrument, sub.running) == BackfillOutcome::Aborted) {
            break;
        }
        if (!sub.running) break;

        try {
            auto feed = feed_factory_();
            bool connected = false;

            feed->run(sub.instrument, config_.bar_interval,
                [&](const BarUpdate& update) {
                    if (!connected) {
                        connected = true;
                        backoff_.record_success(key);
                    }
                    return sub.running.load() && sub.queue.push(update);
                },
                sub.running);

            // run() returns only when asked to stop
            break;
        } catch (const FeedDisconnected& e) {
            auto delay = backoff_.record_failure(key);
            spdlog::warn("Feed for {} disconnected: {}. Reconnecting in {} ms (attempt {})",
                         sub.instrument, e.what(), delay.count(), backoff_.failure_count(key));
            if (!sleep_while(sub.running, delay)) break;
        } catch (const std::exception& e) {
            auto delay = backoff_.record_failure(key);
            spdlog::error("Feed for {} failed: {}. Reconnecting in {} ms", sub.instrument, e.what(), delay.count());
            if (!sleep_while(sub.running, delay)) break;
        }
    }

    sub.queue.close();
}

void IngestionPipeline::consume(Subscription& sub) {
    while (true) {
        auto update = sub.queue.pop(std::chrono::milliseconds(200));
        if (!update) {
            if (sub.queue.closed()) break;
            continue;
        }
        handle_update(*update, sub.instrument);
    }
}

bool IngestionPipeline::is_well_formed(const BarUpdate& update, const std::string& instrument) const {
    return update.instrument == instrument &&
           update.interval == config_.bar_interval &&
           update.open_time_ms > 0 &&
           update.close_time_ms >= update.open_time_ms &&
           update.open > 0.0 && update.high > 0.0 && update.low > 0.0 && update.close > 0.0 &&
           update.high >= update.low &&
           update.volume >= 0.0 && update.quote_volume >= 0.0;
}

std::optional<UpsertResult> IngestionPipeline::handle_update(const BarUpdate& update, const std::string& instrument) {
    if (!is_well_formed(update, instrument)) {
        malformed_++;
        spdlog::warn("Discarding malformed update for {} {} at {}",
                     update.instrument, update.interval, update.open_time_ms);
        return std::nullopt;
    }

    UpsertResult result = store_.upsert(update);
    switch (result) {
        case UpsertResult::Inserted:
        case UpsertResult::Updated:
            updates_applied_++;
            if (update.is_final) {
                bars_finalized_++;
                spdlog::debug("Bar closed: {} {} {} close={}", update.instrument, update.interval,
                              util::format_epoch_ms(update.open_time_ms), update.close);
                if (on_finalized_) {
                    on_finalized_(update.key());
                }
            }
            break;
        case UpsertResult::RejectedFinal:
            rejected_final_++;
            spdlog::debug("Ignoring update for finalized bar {} {}", update.instrument, update.open_time_ms);
            break;
        case UpsertResult::Failed:
            // Dropped; the next update for this key rewrites the row
            store_failures_++;
            break;
        case UpsertResult::SkippedExisting:
            break;
    }
    return result;
}

BackfillOutcome IngestionPipeline::backfill(const std::string& instrument, const std::atomic<bool>& active) {
    const std::string key = backfill_key(instrument);
    const std::string& interval = config_.bar_interval;
    const int window = config_.window_size;

    try {
        if (store_.count_closed(instrument, interval) >= window) {
            universe_.clear_degraded(instrument);
            return BackfillOutcome::NotNeeded;
        }
    } catch (const StoreError& e) {
        spdlog::warn("Could not count stored bars for {}: {}", instrument, e.what());
    }

    for (int attempt = 1; attempt <= config_.backfill_max_attempts; ++attempt) {
        if (!active || !running_) {
            return BackfillOutcome::Aborted;
        }

        try {
            // One extra row: the newest is usually still forming
            auto bars = client_.fetch_recent_bars(instrument, interval, window + 1);

            int inserted = 0;
            int failed = 0;
            for (const auto& bar : bars) {
                if (!bar.is_final || !is_well_formed(bar, instrument)) continue;

                auto result = store_.insert_if_absent(bar);
                if (result == UpsertResult::Inserted) {
                    inserted++;
                } else if (result == UpsertResult::Failed) {
                    failed++;
                }
            }

            if (failed > 0) {
                throw MarketDataUnavailable(std::to_string(failed) + " rows could not be stored");
            }

            backfilled_bars_ += static_cast<uint64_t>(inserted);
            backoff_.record_success(key);
            universe_.clear_degraded(instrument);
            spdlog::info("Backfilled {} bars for {} {} ({} received)", inserted, instrument, interval, bars.size());
            return BackfillOutcome::Completed;
        } catch (const MarketDataUnavailable& e) {
            auto delay = backoff_.record_failure(key);
            spdlog::warn("Backfill attempt {}/{} for {} failed: {}",
                         attempt, config_.backfill_max_attempts, instrument, e.what());
            if (attempt < config_.backfill_max_attempts && !sleep_while(active, delay)) {
                return BackfillOutcome::Aborted;
            }
        }
    }

    universe_.mark_degraded(instrument);
    spdlog::error("Backfill for {} exhausted {} attempts; detection disabled until the next refresh",
                  instrument, config_.backfill_max_attempts);
    return BackfillOutcome::Degraded;
}

void IngestionPipeline::retry_degraded() {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    for (const auto& instrument : universe_.degraded()) {
        if (!running_) return;
        if (!universe_.is_active(instrument)) {
            universe_.clear_degraded(instrument);
            continue;
        }

        auto it = subscriptions_.find(instrument);
        if (it == subscriptions_.end()) continue;
        Subscription* sub = it->second.get();
        if (sub->retrying.exchange(true)) {
            spdlog::debug("Backfill retry for {} still in progress", instrument);
            continue;
        }
        // The previous retry thread has already returned
        if (sub->retry.joinable()) sub->retry.join();

        spdlog::info("Retrying backfill for degraded instrument {}", instrument);
        sub->retry = std::thread([this, sub]() {
            try {
                backfill(sub->instrument, sub->running);
            } catch (const std::exception& e) {
                spdlog::error("Backfill retry for {} failed: {}", sub->instrument, e.what());
            }
            sub->retrying = false;
        });
    }
}

IngestionStats IngestionPipeline::stats() const {
    IngestionStats s;
    s.updates_applied = updates_applied_;
    s.bars_finalized = bars_finalized_;
    s.rejected_final = rejected_final_;
    s.malformed = malformed_;
    s.store_failures = store_failures_;
    s.backfilled_bars = backfilled_bars_;
    return s;
}

bool IngestionPipeline::sleep_while(const std::atomic<bool>& flag, std::chrono::milliseconds duration) const {
    auto wake_up_time = std::chrono::steady_clock::now() + duration;
    while (flag && running_ && std::chrono::steady_clock::now() < wake_up_time) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return flag && running_;
}
