#pragma once
#include "PlatformConfig.h"
#include "Result.h"
#include "ByteSource.h"
#include "CarveSessionTracker.h"
#include <string>
#include <vector>

using namespace std;

// ============================================================================
// 提取结果（内存副本）
// ============================================================================
struct Artifact {
    string typeId;
    string extension;
    ULONGLONG startOffset = 0;
    ULONGLONG endOffset = 0;
    bool footerFound = false;
    vector<BYTE> data;

    ULONGLONG Length() const { return endOffset - startOffset; }
};

// ============================================================================
// 提取目标 - 接收一个会话的字节流
// 调用顺序：Begin -> Write* -> Commit；任一步失败后调用 Abort
// ============================================================================
class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;

    virtual RC::Result<void> Begin(const CarveSession& session) = 0;
    virtual RC::Result<void> Write(const BYTE* data, size_t size) = 0;

    // 成功时返回输出名称（如文件名）
    virtual RC::Result<string> Commit() = 0;
    virtual void Abort() = 0;
};

// ============================================================================
// 提取器 - 从字节源复制完成会话的字节区间
// ============================================================================
class Extractor {
private:
    size_t blockSize;               // 流式写出的块大小
    ULONGLONG memoryLimit;          // Extract() 的内存副本上限

public:
    static constexpr size_t DEFAULT_BLOCK_SIZE = 1024 * 1024;                   // 1MB
    static constexpr ULONGLONG DEFAULT_MEMORY_LIMIT = 256ULL * 1024 * 1024;     // 256MB

    Extractor(size_t blockSize = DEFAULT_BLOCK_SIZE, ULONGLONG memoryLimit = DEFAULT_MEMORY_LIMIT);

    // 读取完成会话的全部字节到内存
    RC::Result<Artifact> Extract(const CarveSession& session, ByteSource& source) const;

    // 读取 [start, end) 到内存
    RC::Result<vector<BYTE>> Extract(ULONGLONG start, ULONGLONG end, ByteSource& source) const;

    // 分块写入目标，返回写出的字节数；失败时目标被中止
    RC::Result<ULONGLONG> ExtractTo(const CarveSession& session, ByteSource& source,
                                    ArtifactSink& sink, string* outputName = nullptr) const;

    size_t GetBlockSize() const { return blockSize; }
    ULONGLONG GetMemoryLimit() const { return memoryLimit; }
};
