#pragma once
#include "types.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

// Live connection lost or went idle; the caller resubscribes with backoff
class FeedDisconnected : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Push feed of bar updates for one (instrument, interval)
class BarFeed {
public:
    // Return false to end the subscription
    using UpdateHandler = std::function<bool(const BarUpdate&)>;

    virtual ~BarFeed() = default;

    // Blocks delivering updates until `running` clears or the handler returns
    // false. Throws FeedDisconnected when the connection drops.
    virtual void run(const std::string& instrument,
                     const std::string& interval,
                     const UpdateHandler& on_update,
                     const std::atomic<bool>& running) = 0;
};

using BarFeedFactory = std::function<std::unique_ptr<BarFeed>()>;
