#pragma once
#include "PlatformConfig.h"
#include <atomic>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <string>

using namespace std;

// 日志级别
enum LogLevel {
    LOG_DEBUG = 0,
    LOG_INFO = 1,
    LOG_WARNING = 2,
    LOG_ERROR = 3,
    LOG_FATAL = 4
};

// 日志轮转默认值
#define LOG_RECORD_MAX_SIZE 50000      // 单个日志文件最大条数
#define LOG_ROTATION_KEEP_COUNT 3      // 保留最近 3 个备份

// ============================================================================
// 日志记录器 - 单例
// 每条记录带线程标签：主线程为 "main"，分段扫描的 worker 在启动时设置 "seg-N"，
// 便于在并行扫描的日志中区分来源。
// ============================================================================
class Logger {
private:
    ofstream logFile;
    atomic<int> currentLevel;
    mutex logMutex;
    bool consoleOutput;
    bool fileOutput;
    string logFilePath;

    ULONGLONG recordsInFile;        // 当前文件已写条数（轮转后清零）
    ULONGLONG recordsTotal;         // 本次会话总条数
    ULONGLONG rotationRecordLimit;
    size_t rotationKeepCount;
    size_t rotationCount;

    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    string GetTimestamp();
    static const char* GetLevelString(LogLevel level);

    // 以下两个函数在持有 logMutex 时调用
    void RotateLog();
    void CleanupOldBackups(const string& baseName, const string& extension);

public:
    static Logger& GetInstance();

    // 打开日志文件（追加模式），写入会话头
    void Initialize(const string& filename = "rawcarve.log", LogLevel level = LOG_INFO);
    void Close();

    // 控制台输出走 stderr，避免和进度条、汇总混在一起
    void SetConsoleOutput(bool enable);
    void SetFileOutput(bool enable);

    void SetLogLevel(LogLevel level) { currentLevel = level; }
    LogLevel GetLogLevel() const { return static_cast<LogLevel>(currentLevel.load()); }
    bool IsEnabled(LogLevel level) const { return level >= currentLevel.load(); }

    // 当前文件写满 maxRecords 条后轮转，保留 keepCount 个备份
    void SetRotation(ULONGLONG maxRecords, size_t keepCount);
    size_t GetRotationCount() const { return rotationCount; }
    const string& GetLogFilePath() const { return logFilePath; }

    // 当前线程的标签（thread_local）
    static void SetThreadTag(const string& tag);
    static const string& GetThreadTag();

    void Log(LogLevel level, const string& message);

    void Debug(const string& message) { Log(LOG_DEBUG, message); }
    void Info(const string& message) { Log(LOG_INFO, message); }
    void Warning(const string& message) { Log(LOG_WARNING, message); }
    void Error(const string& message) { Log(LOG_ERROR, message); }
    void Fatal(const string& message) { Log(LOG_FATAL, message); }

    // printf 风格格式化，超过 1023 字节截断
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args... args) {
        if (!IsEnabled(level)) {
            return;
        }
        char buffer[1024] = { 0 };
        snprintf(buffer, sizeof(buffer), format, args...);
        Log(level, string(buffer));
    }
};

#define LOG_DEBUG(msg) Logger::GetInstance().Debug(msg)
#define LOG_INFO(msg) Logger::GetInstance().Info(msg)
#define LOG_WARNING(msg) Logger::GetInstance().Warning(msg)
#define LOG_ERROR(msg) Logger::GetInstance().Error(msg)
#define LOG_FATAL(msg) Logger::GetInstance().Fatal(msg)

#define LOG_DEBUG_FMT(...) Logger::GetInstance().LogFormat(LOG_DEBUG, __VA_ARGS__)
#define LOG_INFO_FMT(...) Logger::GetInstance().LogFormat(LOG_INFO, __VA_ARGS__)
#define LOG_WARNING_FMT(...) Logger::GetInstance().LogFormat(LOG_WARNING, __VA_ARGS__)
#define LOG_ERROR_FMT(...) Logger::GetInstance().LogFormat(LOG_ERROR, __VA_ARGS__)
#define LOG_FATAL_FMT(...) Logger::GetInstance().LogFormat(LOG_FATAL, __VA_ARGS__)
