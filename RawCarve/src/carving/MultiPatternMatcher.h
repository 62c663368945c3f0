#pragma once
#include "PlatformConfig.h"
#include "SignatureCatalog.h"
#include "WindowBuffer.h"
#include <array>
#include <string>
#include <vector>

using namespace std;

enum class MatchKind {
    Header,
    Footer
};

// ============================================================================
// 匹配事件 - 由匹配器产生，立即交给会话跟踪器
// ============================================================================
struct MatchEvent {
    const SignatureDefinition* signature;   // 指向签名库中的定义（不拥有）
    size_t typeIndex;                       // 签名在签名库中的声明顺序
    MatchKind kind;
    ULONGLONG absoluteOffset;               // 模式第一个字节在流中的偏移
    size_t patternLength;

    const string& TypeId() const { return signature->typeId; }
};

// ============================================================================
// 多模式匹配器
// 以每个模式的最长字面量段为锚点构建 Aho-Corasick 自动机（完整转移表），
// 单次扫描窗口即可找到全部文件头/文件尾，耗时与签名数量无关。
// 锚点命中后再用完整模式（含通配位置）校验。
// ============================================================================
class MultiPatternMatcher {
private:
    struct PatternEntry {
        size_t typeIndex;
        MatchKind kind;
        const BytePattern* pattern;
        const SignatureDefinition* signature;
    };

    struct Node {
        array<uint32_t, 256> next;      // 完整转移表（构建后无空洞）
        uint32_t failure;               // 失败链接
        vector<uint32_t> outputs;       // 在此结束的锚点（含失败链上的）

        Node() : failure(0) { next.fill(0); }
    };

    const SignatureCatalog& catalog;
    vector<PatternEntry> patterns;
    vector<Node> nodes;

    void AddPattern(size_t typeIndex, MatchKind kind, const SignatureDefinition& def,
                    const BytePattern& pattern);
    void BuildFailureLinks();

    // 同一偏移处多个文件头只保留最具体的一个
    static void ResolveTies(vector<MatchEvent>& events);

public:
    explicit MultiPatternMatcher(const SignatureCatalog& catalog);

    // 扫描窗口，把起始位置落在已确定前缀内的匹配按偏移顺序追加到 events
    void Scan(const WindowView& view, vector<MatchEvent>& events) const;

    size_t GetPatternCount() const { return patterns.size(); }
    size_t GetNodeCount() const { return nodes.size(); }
};
