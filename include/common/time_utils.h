#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <chrono>
#include <cstdint>
#include <google/protobuf/timestamp.pb.h>

namespace token_service {

using TimePoint = std::chrono::system_clock::time_point;

// ==================== time_point <-> Unix 秒 ====================

inline int64_t ToUnixSeconds(const TimePoint& tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline TimePoint FromUnixSeconds(int64_t seconds) {
    return TimePoint{std::chrono::seconds(seconds)};
}

// ==================== time_point <-> MySQL DATETIME ====================

/**
 * @brief time_point 转 MySQL DATETIME 字符串
 * @return 格式 "YYYY-MM-DD HH:MM:SS"（UTC，秒级精度）
 */
inline std::string ToDatetimeString(const TimePoint& tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&time, &tm);  // 线程安全（POSIX）
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

/**
 * @brief MySQL DATETIME 字符串转 time_point
 * @param time_str 格式 "YYYY-MM-DD HH:MM:SS"（UTC）
 * @return 解析失败返回 epoch
 */
inline TimePoint FromDatetimeString(const std::string& time_str) {
    if (time_str.empty()) {
        return TimePoint{};
    }

    std::tm tm = {};
    std::istringstream ss(time_str);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");

    if (ss.fail()) {
        return TimePoint{};
    }

    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

// ==================== Protobuf Timestamp ====================

inline void ToProtoTimestamp(const TimePoint& tp, google::protobuf::Timestamp* ts) {
    if (!ts) return;
    ts->set_seconds(ToUnixSeconds(tp));
    ts->set_nanos(0);
}

}  // namespace token_service
