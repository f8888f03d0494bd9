#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace token_service{

// 全局日志：spdlog 异步 logger（控制台 + 轮转文件）
class Logger{
public:
    static void Init(const std::string& log_path,
                     const std::string& filename,
                     const std::string& level="info",
                     size_t max_size = 5*1024*1024,
                     int max_files=3,
                     bool console_output=true);

    static void Shutdown();

    static bool IsInitialized(){return initialized;}

    // 运行期调整级别（配置热更新 / 测试用）
    static void SetLevel(const std::string& level);

private:
    static spdlog::level::level_enum ParseLevel(const std::string& level);
    static std::shared_ptr<spdlog::logger> BuildConsoleOnly(std::vector<spdlog::sink_ptr>& sinks,
                                                            const std::string& level);
    static bool initialized;
};

inline constexpr const char* kLoggerName = "token_service";

// 未初始化时静默（单元测试中不强制初始化日志）
#define LOG_TRACE(...) do { if (token_service::Logger::IsInitialized()) { SPDLOG_TRACE(__VA_ARGS__); } } while(0)
#define LOG_DEBUG(...) do { if (token_service::Logger::IsInitialized()) { SPDLOG_DEBUG(__VA_ARGS__); } } while(0)
#define LOG_INFO(...) do { if (token_service::Logger::IsInitialized()) { SPDLOG_INFO(__VA_ARGS__); } } while(0)
#define LOG_WARN(...) do { if (token_service::Logger::IsInitialized()) { SPDLOG_WARN(__VA_ARGS__); } } while(0)
#define LOG_ERROR(...) do { if (token_service::Logger::IsInitialized()) { SPDLOG_ERROR(__VA_ARGS__); } } while(0)

}
