#pragma once
#include "PlatformConfig.h"
#include "Result.h"
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace std;

// ============================================================================
// 可随机读取的字节源（磁盘镜像、设备转储或内存数据）
// ============================================================================
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // 从 offset 读取最多 size 字节，返回实际读取的字节数（到达末尾时可能较少）
    virtual RC::Result<size_t> ReadAt(ULONGLONG offset, BYTE* buffer, size_t size) = 0;

    // 总长度（字节）
    virtual ULONGLONG Length() const = 0;

    // 用于日志和报告的描述
    virtual string Describe() const = 0;
};

// ============================================================================
// 文件字节源 - 读操作串行化，可被多个扫描线程共享
// ============================================================================
class FileByteSource : public ByteSource {
private:
    string path;
    ifstream stream;
    ULONGLONG length;
    mutex readMutex;

    FileByteSource(const string& path, ULONGLONG length);

public:
    static RC::Result<unique_ptr<FileByteSource>> Open(const string& path);

    RC::Result<size_t> ReadAt(ULONGLONG offset, BYTE* buffer, size_t size) override;
    ULONGLONG Length() const override { return length; }
    string Describe() const override { return path; }
};

// ============================================================================
// 内存字节源
// ============================================================================
class MemoryByteSource : public ByteSource {
private:
    vector<BYTE> data;
    string name;

public:
    explicit MemoryByteSource(vector<BYTE> bytes, const string& name = "memory");

    RC::Result<size_t> ReadAt(ULONGLONG offset, BYTE* buffer, size_t size) override;
    ULONGLONG Length() const override { return data.size(); }
    string Describe() const override { return name; }
};
