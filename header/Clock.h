#pragma once
#include <chrono>

// Time source for phase deadlines. Seconds since an arbitrary epoch.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now_seconds() const = 0;
};

class SteadyClock : public Clock {
public:
    SteadyClock() : start_(std::chrono::steady_clock::now()) {}

    double now_seconds() const override {
        using namespace std::chrono;
        return duration_cast<duration<double>>(steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Manually advanced clock for tests and the headless driver
class ManualClock : public Clock {
public:
    explicit ManualClock(double start = 0.0) : now_(start) {}

    double now_seconds() const override { return now_; }
    void set(double t) { now_ = t; }
    void advance(double dt) { now_ += dt; }

private:
    double now_;
};
