#pragma once
#include "PlatformConfig.h"
#include "BytePattern.h"
#include "Result.h"
#include <string>
#include <vector>
#include <unordered_map>
#include <limits>

using namespace std;

// 无上限
constexpr ULONGLONG UNBOUNDED_SIZE = numeric_limits<ULONGLONG>::max();

// 默认的全局兜底上限：无上限的类型最多跟踪这么远
constexpr ULONGLONG DEFAULT_SANITY_LIMIT = 4ULL * 1024 * 1024 * 1024;   // 4GB

// 文件结束位置的判定策略
enum class SizePolicy {
    FooterTerminated,       // 文件尾决定结束位置，超过 maxSize 仍未找到则丢弃
    FixedLength,            // 固定长度
    MaxSizeCapped           // 到达 maxSize 即结束（可选文件尾提前结束）
};

// 文件尾是否计入雕刻结果
enum class FooterMode {
    Inclusive,              // 结束于文件尾之后
    Exclusive               // 结束于文件尾之前（文件尾是下一个文件的头）
};

// ============================================================================
// 文件签名定义
// ============================================================================
struct SignatureDefinition {
    string typeId;              // 唯一类型标识（如 "jpeg"）
    string extension;           // 输出扩展名（为空时使用 typeId）
    string description;         // 描述
    BytePattern header;         // 文件头签名
    BytePattern footer;         // 文件尾签名（可为空）
    FooterMode footerMode;
    SizePolicy sizePolicy;
    ULONGLONG maxSize;          // 最大文件大小（字节）
    ULONGLONG fixedSize;        // 固定长度（仅 FixedLength）
    bool allowOverlap;          // 允许同类型会话嵌套/重叠

    SignatureDefinition()
        : footerMode(FooterMode::Inclusive), sizePolicy(SizePolicy::FooterTerminated),
          maxSize(UNBOUNDED_SIZE), fixedSize(0), allowOverlap(false) {}

    bool HasFooter() const { return !footer.Empty(); }
    const string& Extension() const { return extension.empty() ? typeId : extension; }
};

const char* SizePolicyName(SizePolicy policy);
const char* FooterModeName(FooterMode mode);

// ============================================================================
// 签名库 - 构造后只读，可被多个扫描线程并发读取
// ============================================================================
class SignatureCatalog {
private:
    vector<SignatureDefinition> definitions;
    unordered_map<string, size_t> typeIndex;
    size_t maxPatternLength;
    ULONGLONG sanityLimit;

    SignatureCatalog();

    static RC::ErrorInfo ValidateDefinition(const SignatureDefinition& def);

public:
    // 校验并构造签名库
    static RC::Result<SignatureCatalog> Create(vector<SignatureDefinition> defs,
                                               ULONGLONG sanityLimit = DEFAULT_SANITY_LIMIT);

    // 所有签名（声明顺序）
    const vector<SignatureDefinition>& LookupHeaders() const { return definitions; }

    // 有文件尾的类型返回其定义，否则返回 nullptr
    const SignatureDefinition* LookupFooter(const string& typeId) const;

    const SignatureDefinition* Find(const string& typeId) const;
    const SignatureDefinition& At(size_t index) const { return definitions[index]; }

    size_t Size() const { return definitions.size(); }

    // 所有文件头/文件尾中最长的模式长度
    size_t MaxPatternLength() const { return maxPatternLength; }

    ULONGLONG SanityLimit() const { return sanityLimit; }

    // min(maxSize, sanityLimit)
    ULONGLONG EffectiveMaxSize(const SignatureDefinition& def) const;
    ULONGLONG LargestEffectiveMaxSize() const;

    // 仅保留指定类型的子签名库（保持声明顺序）
    RC::Result<SignatureCatalog> Select(const vector<string>& typeIds) const;

    vector<string> GetTypeIds() const;
};
