#pragma once
#include "PlatformConfig.h"
#include "ErrorCodes.h"
#include "SignatureCatalog.h"
#include "CarveEngine.h"
#include "ByteSource.h"
#include <atomic>
#include <functional>
#include <vector>

using namespace std;

struct ParallelCarveConfig {
    int workerCount = 0;                            // <= 0 自动检测
    size_t chunkSize = 8 * 1024 * 1024;             // 8MB
    ULONGLONG segmentSize = 256ULL * 1024 * 1024;   // 256MB
};

struct ParallelCarveResult {
    vector<CarveSession> sessions;      // 合并后按起始偏移排序
    CarveEngineStats stats;             // 各段统计之和（含重叠区的重复计数）
    ULONGLONG bytesScanned = 0;
    int segmentCount = 0;
    int workerCount = 0;
    int rescannedSegments = 0;          // 接续前一段状态后重扫的段数
    bool cancelled = false;
    RC::ErrorInfo error;                // 第一个失败段的错误
};

// ============================================================================
// 并行分段雕刻
// 输入被切成若干段，每段扫描 [段起点, 段终点 + 重叠区)，
// 重叠区 = 最大有效文件大小 + 最长模式长度，保证起始于本段的会话都能结算。
// 各段先从空状态并行扫描；合并时按段顺序接续同类型的占用范围，
// 从空状态开始导致结果不同的段用接续状态重扫，结果与顺序扫描一致。
// ============================================================================
class ParallelCarver {
private:
    const SignatureCatalog& catalog;
    ParallelCarveConfig config;
    atomic<bool> stopRequested;

public:
    ParallelCarver(const SignatureCatalog& catalog, const ParallelCarveConfig& config);

    // 进度回调参数：已扫描字节数、总字节数、已找到的会话数
    RC::Result<ParallelCarveResult> Scan(ByteSource& source,
                                         function<void(ULONGLONG, ULONGLONG, ULONGLONG)> progress = nullptr);

    void Stop() { stopRequested = true; }

    ULONGLONG OverlapLength() const;

    // 合并各段结果：按起始偏移排序、去重，并对不允许重叠的类型
    // 丢弃起始于已接受的同类型会话内部的会话
    static vector<CarveSession> MergeSegmentSessions(vector<CarveSession> sessions);
};
