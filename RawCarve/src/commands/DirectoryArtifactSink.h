#pragma once
#include "PlatformConfig.h"
#include "Result.h"
#include "Extractor.h"
#include <fstream>
#include <memory>
#include <string>

using namespace std;

// ============================================================================
// 目录输出 - 每个会话写入 recovered_<起始偏移>_<类型>.<扩展名>
// 先写 .part 临时文件，提交时重命名，中止时删除
// ============================================================================
class DirectoryArtifactSink : public ArtifactSink {
private:
    string directory;
    ofstream current;
    string partPath;
    string finalPath;
    string fileName;
    bool active;
    size_t committedCount;

    explicit DirectoryArtifactSink(const string& directory);

public:
    ~DirectoryArtifactSink() override;

    // 创建输出目录（不存在时）
    static RC::Result<unique_ptr<DirectoryArtifactSink>> Create(const string& directory);

    static string MakeFileName(const CarveSession& session);

    RC::Result<void> Begin(const CarveSession& session) override;
    RC::Result<void> Write(const BYTE* data, size_t size) override;
    RC::Result<string> Commit() override;
    void Abort() override;

    const string& GetDirectory() const { return directory; }
    size_t GetCommittedCount() const { return committedCount; }
};
