#pragma once
#include "PlatformConfig.h"
#include "Result.h"
#include <string>
#include <vector>

using namespace std;

// ============================================================================
// 字节模式 - 文件头/文件尾签名，允许通配位置（"??" 匹配任意字节）
// ============================================================================
class BytePattern {
private:
    vector<BYTE> bytes;             // 模式字节（通配位置的值无意义）
    vector<bool> wildcards;         // 通配掩码，与 bytes 等长
    size_t literalCount;            // 非通配字节数
    size_t anchorOffset;            // 锚点字面量段的起始位置
    size_t anchorLength;            // 锚点字面量段的长度

    void ComputeAnchor();

public:
    BytePattern();
    explicit BytePattern(vector<BYTE> literalBytes);
    BytePattern(vector<BYTE> patternBytes, vector<bool> wildcardMask);

    // 从十六进制文本解析，例如 "FF D8 FF E0"、"52494646????????57415645"
    static RC::Result<BytePattern> Parse(const string& text);

    size_t Length() const { return bytes.size(); }
    bool Empty() const { return bytes.empty(); }

    BYTE At(size_t index) const { return bytes[index]; }
    bool IsWildcard(size_t index) const { return wildcards[index]; }
    size_t LiteralCount() const { return literalCount; }

    // 自动机索引使用的锚点（优先非 00/FF 字节最多的字面量段）
    size_t AnchorOffset() const { return anchorOffset; }
    size_t AnchorLength() const { return anchorLength; }

    // 检查 data 开头是否匹配（available 不足时返回 false）
    bool MatchesAt(const BYTE* data, size_t available) const;

    // 格式化为 "FF D8 ?? E0"
    string ToString() const;

    bool operator==(const BytePattern& other) const {
        return bytes == other.bytes && wildcards == other.wildcards;
    }
    bool operator!=(const BytePattern& other) const { return !(*this == other); }
};
