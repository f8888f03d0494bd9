#pragma once

#include <chrono>
#include <mutex>
#include "common/time_utils.h"

namespace token_service {

// 时间源接口：所有与时间相关的组件都通过它取"当前时间"，测试注入 ManualClock
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint Now() const override {
        return std::chrono::system_clock::now();
    }
};

// 手动推进的时钟（线程安全）
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = FromUnixSeconds(1700000000))
        : now_(start) {}

    TimePoint Now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void Advance(std::chrono::seconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

    void Set(TimePoint tp) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = tp;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

}  // namespace token_service
