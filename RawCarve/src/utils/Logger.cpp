#include "Logger.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace {

thread_local string threadTag = "main";

tm LocalTime(time_t seconds) {
    tm localTm;
#ifdef RC_PLATFORM_WINDOWS
    localtime_s(&localTm, &seconds);
#else
    localtime_r(&seconds, &localTm);
#endif
    return localTm;
}

} // namespace

Logger::Logger()
    : currentLevel(LOG_INFO), consoleOutput(false), fileOutput(true),
      recordsInFile(0), recordsTotal(0),
      rotationRecordLimit(LOG_RECORD_MAX_SIZE), rotationKeepCount(LOG_ROTATION_KEEP_COUNT),
      rotationCount(0) {
}

Logger::~Logger() {
    Close();
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

void Logger::SetThreadTag(const string& tag) {
    threadTag = tag;
}

const string& Logger::GetThreadTag() {
    return threadTag;
}

// ============================================================================
// 会话
// ============================================================================
void Logger::Initialize(const string& filename, LogLevel level) {
    lock_guard<mutex> lock(logMutex);

    if (logFile.is_open()) {
        logFile.close();
    }

    logFilePath = filename;
    currentLevel = level;
    recordsInFile = 0;
    recordsTotal = 0;
    rotationCount = 0;

    if (!fileOutput) {
        return;
    }

    logFile.open(filename, ios::out | ios::app);
    if (!logFile.is_open()) {
        cerr << "[WARNING] Cannot open log file: " << filename << endl;
        return;
    }

    logFile << "\n========================================\n";
    logFile << "RawCarve log session started at " << GetTimestamp() << "\n";
    logFile << "Level: " << GetLevelString(level) << "  Platform: " << Platform::GetPlatformName()
            << " " << Platform::GetArchName() << " (" << Platform::GetCompilerName() << ")\n";
    logFile << "========================================\n";
    logFile.flush();
}

void Logger::Close() {
    lock_guard<mutex> lock(logMutex);

    if (logFile.is_open()) {
        logFile << "========================================\n";
        logFile << "Log session ended at " << GetTimestamp() << ": " << recordsTotal
                << " records, " << rotationCount << " rotations\n";
        logFile << "========================================\n\n";
        logFile.close();
    }
}

void Logger::SetConsoleOutput(bool enable) {
    lock_guard<mutex> lock(logMutex);
    consoleOutput = enable;
}

void Logger::SetFileOutput(bool enable) {
    lock_guard<mutex> lock(logMutex);
    fileOutput = enable;
}

void Logger::SetRotation(ULONGLONG maxRecords, size_t keepCount) {
    lock_guard<mutex> lock(logMutex);
    rotationRecordLimit = max<ULONGLONG>(maxRecords, 1);
    rotationKeepCount = keepCount;
}

string Logger::GetTimestamp() {
    auto now = chrono::system_clock::now();
    auto millis = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    tm localTm = LocalTime(chrono::system_clock::to_time_t(now));

    ostringstream oss;
    oss << put_time(&localTm, "%Y-%m-%d %H:%M:%S") << "."
        << setw(3) << setfill('0') << millis;
    return oss.str();
}

const char* Logger::GetLevelString(LogLevel level) {
    switch (level) {
    case LOG_DEBUG:   return "[DEBUG]  ";
    case LOG_INFO:    return "[INFO]   ";
    case LOG_WARNING: return "[WARNING]";
    case LOG_ERROR:   return "[ERROR]  ";
    case LOG_FATAL:   return "[FATAL]  ";
    default:          return "[UNKNOWN]";
    }
}

// ============================================================================
// 轮转：当前文件改名为 <名称>_<时间>_<序号>.<扩展名>，重新打开原文件
// ============================================================================
void Logger::RotateLog() {
    if (logFile.is_open()) {
        logFile << "========================================\n";
        logFile << "Log rotation at " << GetTimestamp() << " after " << recordsInFile << " records\n";
        logFile << "========================================\n";
        logFile.close();
    }

    tm localTm = LocalTime(time(nullptr));
    ostringstream stamp;
    stamp << put_time(&localTm, "%Y%m%d_%H%M%S") << "_"
          << setw(3) << setfill('0') << (rotationCount + 1);

    fs::path current(logFilePath);
    string extension = current.has_extension() ? current.extension().string() : ".log";
    string baseName = (current.parent_path() / current.stem()).string();
    string backupPath = baseName + "_" + stamp.str() + extension;

    error_code ec;
    fs::rename(current, backupPath, ec);
    if (!ec) {
        rotationCount++;
        CleanupOldBackups(baseName, extension);
    }

    logFile.open(logFilePath, ios::out | ios::app);
    if (logFile.is_open()) {
        logFile << "\n========================================\n";
        if (!ec) {
            logFile << "Log rotated at " << GetTimestamp() << ", previous log: " << backupPath << "\n";
        } else {
            logFile << "Log rotation rename failed: " << ec.message() << "\n";
        }
        logFile << "========================================\n";
        logFile.flush();
    }

    recordsInFile = 0;
}

void Logger::CleanupOldBackups(const string& baseName, const string& extension) {
    fs::path base(baseName);
    fs::path directory = base.has_parent_path() ? base.parent_path() : fs::path(".");
    string prefix = base.filename().string() + "_";

    // 时间戳和序号都是定宽的，按文件名排序即按新旧排序
    vector<fs::path> backups;
    error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        string name = it->path().filename().string();
        if (name.size() > prefix.size() + extension.size() &&
            name.compare(0, prefix.size(), prefix) == 0 &&
            it->path().extension().string() == extension) {
            backups.push_back(it->path());
        }
    }

    if (backups.size() <= rotationKeepCount) {
        return;
    }

    sort(backups.begin(), backups.end());
    size_t filesToDelete = backups.size() - rotationKeepCount;
    for (size_t i = 0; i < filesToDelete; i++) {
        fs::remove(backups[i], ec);
    }
}

// ============================================================================
// 写入
// ============================================================================
void Logger::Log(LogLevel level, const string& message) {
    if (!IsEnabled(level)) {
        return;
    }

    string line = GetTimestamp() + " " + GetLevelString(level) + " [" + threadTag + "] " + message;

    lock_guard<mutex> lock(logMutex);

    if (consoleOutput) {
        cerr << line << "\n";
    }

    if (fileOutput && logFile.is_open()) {
        if (recordsInFile >= rotationRecordLimit) {
            RotateLog();
        }

        logFile << line << '\n';

        // 只对警告及以上立即刷新
        if (level >= LOG_WARNING) {
            logFile.flush();
        }

        recordsInFile++;
        recordsTotal++;
    }
}
