#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace stock_sync {

/// Blocking minimum-spacing rate limiter.
/// acquire() returns immediately the first time and afterwards sleeps until
/// at least @p spacing has passed since the previous acquire() returned.
class Pacer {
public:
    using Clock = std::chrono::steady_clock;

    explicit Pacer(std::chrono::milliseconds spacing,
                   std::string name = "Pacer",
                   bool verbose = false);

    void acquire();

    // ---- accessors for summary report ----
    std::chrono::milliseconds spacing() const { return mSpacing; }
    double totalSleepSeconds() const { return mTotalSleep; }
    int    totalAcquisitions() const { return mAcquisitions; }

private:
    std::chrono::milliseconds mSpacing;
    std::string               mName;
    bool                      mVerbose;

    std::optional<Clock::time_point> mLastRelease;

    double mTotalSleep   = 0.0;
    int    mAcquisitions = 0;
};

} // namespace stock_sync
