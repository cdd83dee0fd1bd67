// =============================================================================
// Manual clocks for deterministic timing tests
// =============================================================================
#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace bhvd::test {

/// Monotonic seconds advanced by hand. Copies of clock() share the same time.
class ManualClock {
public:
    explicit ManualClock(double start = 0.0) : now_(std::make_shared<double>(start)) {}

    void advance(double seconds) { *now_ += seconds; }
    void set(double seconds) { *now_ = seconds; }
    double now() const { return *now_; }

    std::function<double()> clock() const {
        auto now = now_;
        return [now] { return *now; };
    }

private:
    std::shared_ptr<double> now_;
};

/// system_clock stand-in; starts at a fixed date so record ids are reproducible.
class ManualWallClock {
public:
    using time_point = std::chrono::system_clock::time_point;

    ManualWallClock()
        : now_(std::make_shared<time_point>(std::chrono::system_clock::from_time_t(1'700'000'000))) {}

    void advance(std::chrono::system_clock::duration delta) { *now_ += delta; }
    void advanceSeconds(long long seconds) { advance(std::chrono::seconds(seconds)); }
    time_point now() const { return *now_; }

    std::function<time_point()> clock() const {
        auto now = now_;
        return [now] { return *now; };
    }

private:
    std::shared_ptr<time_point> now_;
};

} // namespace bhvd::test
