#pragma once
#include "PlatformConfig.h"
#include "Result.h"
#include "SignatureCatalog.h"
#include "CarveEngine.h"
#include "ByteSource.h"
#include "Extractor.h"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

using namespace std;

// ============================================================================
// 运行配置
// ============================================================================
struct CarveRunConfig {
    size_t chunkSize = 8 * 1024 * 1024;             // 每次读取的块大小（8MB）
    int workerCount = 1;                            // 1 = 顺序扫描；<= 0 自动检测
    ULONGLONG segmentSize = 256ULL * 1024 * 1024;   // 并行扫描的段大小
    bool extract = true;                            // 是否提取完成的会话
    size_t maxResults = 0;                          // 0 = 不限制
};

// 一个雕刻出的文件
struct CarvedFileRecord {
    string typeId;
    string extension;
    string description;
    ULONGLONG startOffset = 0;
    ULONGLONG endOffset = 0;
    bool footerFound = false;
    string outputName;                  // 未提取时为空

    ULONGLONG Length() const { return endOffset - startOffset; }
};

// 一次提取失败（不影响其它会话）
struct ExtractionFailure {
    string typeId;
    ULONGLONG startOffset = 0;
    ULONGLONG endOffset = 0;
    RC::ErrorInfo error;
};

// ============================================================================
// 运行报告
// ============================================================================
struct CarveReport {
    string source;
    ULONGLONG sourceLength = 0;
    ULONGLONG bytesScanned = 0;
    vector<CarvedFileRecord> files;
    vector<ExtractionFailure> failures;
    CarveEngineStats stats;
    int workersUsed = 1;
    double elapsedSeconds = 0.0;
    bool cancelled = false;
    bool aborted = false;               // 读取失败导致扫描中止
    bool truncated = false;             // 达到结果数量上限
    RC::ErrorInfo abortError;
};

// ============================================================================
// 雕刻驱动 - 分块读取字节源，送入引擎，提取每个完成的会话
// ============================================================================
class CarveRunner {
public:
    // 参数：已扫描字节数、总字节数、已找到文件数
    using ProgressCallback = function<void(ULONGLONG, ULONGLONG, ULONGLONG)>;

private:
    const SignatureCatalog& catalog;
    CarveRunConfig config;
    Extractor extractor;

    atomic<bool> stopFlag;
    atomic<ULONGLONG> bytesProcessed;
    atomic<ULONGLONG> totalBytes;
    ProgressCallback progressCallback;

    RC::Result<void> RunSequential(ByteSource& source, ArtifactSink* sink, CarveReport& report);
    RC::Result<void> RunParallel(ByteSource& source, ArtifactSink* sink, CarveReport& report);

    // 处理一个完成的会话；返回 false 表示已达到结果上限
    bool HandleSession(const CarveSession& session, ByteSource& source,
                       ArtifactSink* sink, CarveReport& report);

    void ReportProgress(ULONGLONG done, ULONGLONG total, ULONGLONG found);

public:
    CarveRunner(const SignatureCatalog& catalog, const CarveRunConfig& config = CarveRunConfig());

    // 扫描整个字节源；sink 为空或 extract 关闭时只报告区间
    RC::Result<CarveReport> Run(ByteSource& source, ArtifactSink* sink);

    // 协作式取消（可从其它线程调用）
    void StopScanning() { stopFlag = true; }
    bool IsStopRequested() const { return stopFlag.load(); }

    // 进度 (0.0 - 100.0)
    double GetProgress() const;

    void SetProgressCallback(ProgressCallback callback) { progressCallback = move(callback); }
};
