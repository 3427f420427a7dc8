#include "scoring_engine.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

const char* to_string(ScoreOutcome outcome) {
    switch (outcome) {
        case ScoreOutcome::Recorded: return "recorded";
        case ScoreOutcome::Duplicate: return "duplicate";
        case ScoreOutcome::BelowThreshold: return "below_threshold";
        case ScoreOutcome::InsufficientData: return "insufficient_data";
        case ScoreOutcome::Skipped: return "skipped";
        case ScoreOutcome::Failed: return "failed";
    }
    return "unknown";
}

ScoringEngine::ScoringEngine(const Config& config,
                             BarStore& store,
                             AnomalySink& sink,
                             UniverseState& universe,
                             AnomalyPublisher* publisher)
    : config_(config),
      store_(store),
      sink_(sink),
      universe_(universe),
      publisher_(publisher),
      window_manager_(store),
      thresholds_(ScoringThresholds::from_config(config)) {
}

ScoringEngine::~ScoringEngine() {
    stop();
}

void ScoringEngine::notify_finalized(const BarKey& key) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (queued_.insert(key).second) {
        queue_.push_back(key);
        queue_cv_.notify_one();
    }
}

size_t ScoringEngine::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

std::optional<std::chrono::system_clock::time_point> ScoringEngine::last_pass_time() const {
    std::lock_guard<std::mutex> lock(pass_mutex_);
    return last_pass_;
}

ScoreOutcome ScoringEngine::score_bar(const BarKey& key) {
    if (universe_.is_degraded(key.instrument)) {
        return ScoreOutcome::Skipped;
    }

    try {
        auto bar = store_.get(key);
        if (!bar || !bar->is_final) {
            return ScoreOutcome::Skipped;
        }

        auto window = window_manager_.summarize(key.instrument, key.interval,
                                                config_.window_size, key.open_time_ms);
        if (!window) {
            spdlog::debug("Not enough history to score {} {} {}", key.instrument, key.interval, key.open_time_ms);
            return ScoreOutcome::InsufficientData;
        }

        auto result = ::score_bar(*bar, *window, universe_.quote_volume_24h(key.instrument), thresholds_);
        if (!result.triggered && !config_.record_all_bars) {
            return ScoreOutcome::BelowThreshold;
        }

        switch (sink_.upsert(result.record)) {
            case SinkResult::Inserted:
                break;
            case SinkResult::Duplicate:
                return ScoreOutcome::Duplicate;
            case SinkResult::Failed:
                return ScoreOutcome::Failed;
        }

        if (result.triggered) {
            spdlog::info("Anomaly {} {} at {}: score={:.3f} return={:.4f} reasons={}",
                         key.instrument, key.interval, util::format_epoch_ms(key.open_time_ms),
                         result.record.anomaly_score, result.record.cur_return,
                         util::join_strings(result.record.reasons, ","));
            if (publisher_) {
                publisher_->publish(result.record);
            }
        }
        return ScoreOutcome::Recorded;
    } catch (const StoreError& e) {
        spdlog::error("Scoring {} {} {} failed: {}", key.instrument, key.interval, key.open_time_ms, e.what());
        return ScoreOutcome::Failed;
    }
}

PassSummary ScoringEngine::run_pass(bool rescan_active) {
    auto start = std::chrono::steady_clock::now();
    auto deadline = start + std::chrono::milliseconds(config_.scoring_pass_budget_ms);
    PassSummary summary;

    std::deque<BarKey> work;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        work.swap(queue_);
        queued_.clear();
    }

    if (rescan_active) {
        for (const auto& instrument : universe_.active()) {
            if (universe_.is_degraded(instrument)) continue;
            try {
                auto latest = store_.latest_closed(instrument, config_.bar_interval);
                if (latest) {
                    work.push_back(latest->key());
                }
            } catch (const StoreError& e) {
                spdlog::warn("Rescan of {} failed: {}", instrument, e.what());
            }
        }
    }

    while (!work.empty()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            summary.deferred = work.size();
            std::lock_guard<std::mutex> lock(queue_mutex_);
            for (const auto& key : work) {
                if (queued_.insert(key).second) queue_.push_back(key);
            }
            break;
        }

        BarKey key = work.front();
        work.pop_front();

        ScoreOutcome outcome = score_bar(key);
        summary.scored++;
        if (outcome == ScoreOutcome::Recorded) summary.recorded++;
    }

    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    {
        std::lock_guard<std::mutex> lock(pass_mutex_);
        last_pass_ = std::chrono::system_clock::now();
    }

    if (summary.deferred > 0) {
        spdlog::warn("Scoring pass hit its {} ms budget; {} bars deferred",
                     config_.scoring_pass_budget_ms, summary.deferred);
    }
    return summary;
}

void ScoringEngine::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { run_loop(); });
    spdlog::info("Scoring engine started. Rescan every {} seconds.", config_.scoring_pass_seconds);
}

void ScoringEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("Scoring engine stopped");
}

void ScoringEngine::run_loop() {
    auto period = std::chrono::seconds(config_.scoring_pass_seconds);
    auto next_rescan = std::chrono::steady_clock::now() + period;

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_until(lock, next_rescan, [this]() { return !running_ || !queue_.empty(); });
        }
        if (!running_) break;

        bool rescan = std::chrono::steady_clock::now() >= next_rescan;
        try {
            auto summary = run_pass(rescan);
            if (rescan) {
                spdlog::info("Scoring pass: {} bars scored, {} recorded in {} ms",
                             summary.scored, summary.recorded, summary.elapsed.count());
                next_rescan = std::chrono::steady_clock::now() + period;
            } else if (summary.recorded > 0) {
                spdlog::debug("Scored {} new bars, {} recorded", summary.scored, summary.recorded);
            }
        } catch (const std::exception& e) {
            spdlog::error("Error in scoring pass: {}", e.what());
        }
    }
}
