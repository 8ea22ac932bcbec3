#include "pacer.hpp"

#include <iostream>
#include <thread>
#include <utility>

namespace stock_sync {

Pacer::Pacer(std::chrono::milliseconds spacing, std::string name, bool verbose)
    : mSpacing(spacing < std::chrono::milliseconds::zero()
                   ? std::chrono::milliseconds::zero() : spacing)
    , mName(std::move(name))
    , mVerbose(verbose) {}

void Pacer::acquire() {
    ++mAcquisitions;

    if (mLastRelease && mSpacing.count() > 0) {
        const auto readyAt = *mLastRelease + mSpacing;
        const auto now     = Clock::now();
        if (now < readyAt) {
            const auto wait = readyAt - now;
            if (mVerbose) {
                std::cerr << "[" << mName << "] waiting "
                          << std::chrono::duration_cast<std::chrono::milliseconds>(wait).count()
                          << " ms\n";
            }
            std::this_thread::sleep_for(wait);
            mTotalSleep += std::chrono::duration<double>(wait).count();
        }
    }

    mLastRelease = Clock::now();
}

} // namespace stock_sync
