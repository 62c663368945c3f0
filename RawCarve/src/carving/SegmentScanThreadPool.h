#pragma once
#include "PlatformConfig.h"
#include "ErrorCodes.h"
#include "SignatureCatalog.h"
#include "CarveEngine.h"
#include "ByteSource.h"
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <string>

using namespace std;

// ============================================================================
// 分段扫描任务
// 扫描 [segmentStart, scanEnd)，只保留起始位置在 [segmentStart, segmentEnd) 的会话
// ============================================================================
struct SegmentTask {
    ULONGLONG segmentStart;         // 本段拥有的起始偏移下界
    ULONGLONG segmentEnd;           // 本段拥有的起始偏移上界（不含）
    ULONGLONG scanEnd;              // 实际扫描终点（含重叠区）
    int taskId;                     // 任务ID（用于结果排序）
    vector<ULONGLONG> claimedUntil; // 按类型：前面的段占用到的绝对偏移（为空表示从空状态开始）
};

// 本段拥有的会话（完成或丢弃）挡住同类型文件头的范围 [startOffset, claimEnd)
struct SessionClaim {
    size_t typeIndex;
    ULONGLONG startOffset;
    ULONGLONG claimEnd;
};

// ============================================================================
// 任务执行结果
// ============================================================================
struct SegmentTaskResult {
    int taskId;
    vector<CarveSession> sessions;  // 本段拥有的完成会话（绝对偏移）
    vector<SessionClaim> claims;    // 本段拥有的不允许重叠类型的会话，按结束顺序
    CarveEngineStats stats;
    ULONGLONG bytesScanned;
    bool cancelled;
    RC::ErrorInfo error;            // 读取失败等
};

// ============================================================================
// 线程池配置
// ============================================================================
struct SegmentScanConfig {
    int workerCount;                // 工作线程数
    size_t chunkSize;               // 每次送入引擎的数据块大小
    size_t maxQueueSize;            // 任务队列最大长度
    bool autoDetectThreads;         // 自动检测最优线程数

    SegmentScanConfig()
        : workerCount(4)
        , chunkSize(8 * 1024 * 1024)    // 8MB per chunk
        , maxQueueSize(64)
        , autoDetectThreads(false)
    {}
};

// ============================================================================
// 分段扫描线程池
// 每个任务在工作线程中用独立的 CarveEngine 扫描一个段；
// 线程间共享的只有只读的签名库和线程安全的字节源。
// ============================================================================
class SegmentScanThreadPool {
private:
    // ==================== 线程管理 ====================
    vector<thread> workers;
    atomic<bool> stopFlag;
    const atomic<bool>* cancelFlag;         // 外部取消标志（可为空）

    // ==================== 任务队列 ====================
    queue<SegmentTask> taskQueue;
    mutex queueMutex;
    condition_variable taskAvailable;       // 通知有新任务
    condition_variable queueNotFull;        // 通知队列有空位

    // ==================== 结果收集 ====================
    vector<SegmentTaskResult> results;
    mutex resultsMutex;

    // ==================== 共享只读数据 ====================
    const SignatureCatalog& catalog;
    ByteSource& source;

    // ==================== 统计信息 ====================
    atomic<int> completedTasks;
    atomic<int> totalTasks;
    atomic<ULONGLONG> totalSessionsFound;
    atomic<ULONGLONG> totalBytesScanned;

    // ==================== 配置 ====================
    SegmentScanConfig config;

    // 工作线程主函数
    void WorkerFunction(int workerIndex);

    bool ShouldStop() const {
        return stopFlag.load() || (cancelFlag != nullptr && cancelFlag->load());
    }

public:
    SegmentScanThreadPool(const SignatureCatalog& catalog, ByteSource& source,
                          const SegmentScanConfig& cfg = SegmentScanConfig(),
                          const atomic<bool>* cancelFlag = nullptr);

    ~SegmentScanThreadPool();

    // ==================== 线程池控制 ====================
    void Start();
    void Stop();

    // ==================== 任务管理 ====================

    // 提交扫描任务（阻塞式，队列满时等待）
    void SubmitTask(const SegmentTask& task);

    bool IsComplete() const { return completedTasks.load() >= totalTasks.load(); }

    // 获取全部任务结果（按 taskId 排序）
    vector<SegmentTaskResult> TakeResults();

    // ==================== 状态查询 ====================

    // 获取进度 (0.0 - 100.0)
    double GetProgress() const;

    // 各段已找到的会话数（合并前，重叠修正之前的计数）
    ULONGLONG GetTotalSessionsFound() const { return totalSessionsFound.load(); }
    ULONGLONG GetTotalBytesScanned() const { return totalBytesScanned.load(); }
    int GetWorkerCount() const { return config.workerCount; }

    // 扫描单个段（工作线程和合并时的重扫共用）
    // bytesCounter 非空时按块累加已扫描字节数
    static void ScanSegment(const SignatureCatalog& catalog, ByteSource& source, size_t chunkSize,
                            const SegmentTask& task, SegmentTaskResult& result,
                            const function<bool()>& shouldStop,
                            atomic<ULONGLONG>* bytesCounter = nullptr);

    // 获取最优线程数（基于硬件检测）
    static int GetOptimalThreadCount();
};

// ============================================================================
// 辅助函数：获取系统信息
// ============================================================================
namespace ThreadPoolUtils {
    // 获取CPU逻辑核心数
    int GetLogicalCoreCount();
}
