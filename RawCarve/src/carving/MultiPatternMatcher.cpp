#include "MultiPatternMatcher.h"
#include "Logger.h"
#include <algorithm>
#include <queue>

// ============================================================================
// 构造：插入全部锚点并构建失败链接
// ============================================================================
MultiPatternMatcher::MultiPatternMatcher(const SignatureCatalog& sigCatalog)
    : catalog(sigCatalog) {
    nodes.emplace_back();   // 根节点

    const auto& defs = catalog.LookupHeaders();
    for (size_t i = 0; i < defs.size(); i++) {
        AddPattern(i, MatchKind::Header, defs[i], defs[i].header);
        if (defs[i].HasFooter()) {
            AddPattern(i, MatchKind::Footer, defs[i], defs[i].footer);
        }
    }

    BuildFailureLinks();

    LOG_DEBUG_FMT("Matcher automaton built: %zu patterns, %zu nodes",
                  patterns.size(), nodes.size());
}

void MultiPatternMatcher::AddPattern(size_t typeIndex, MatchKind kind,
                                     const SignatureDefinition& def,
                                     const BytePattern& pattern) {
    uint32_t patternId = static_cast<uint32_t>(patterns.size());
    patterns.push_back({ typeIndex, kind, &pattern, &def });

    // 沿锚点字节插入 trie
    uint32_t current = 0;
    size_t anchorEnd = pattern.AnchorOffset() + pattern.AnchorLength();
    for (size_t i = pattern.AnchorOffset(); i < anchorEnd; i++) {
        BYTE b = pattern.At(i);
        uint32_t child = nodes[current].next[b];
        if (child == 0) {
            child = static_cast<uint32_t>(nodes.size());
            nodes.emplace_back();
            nodes[current].next[b] = child;
        }
        current = child;
    }

    nodes[current].outputs.push_back(patternId);
}

// ============================================================================
// BFS 构建失败链接，同时把缺失的转移补全为 DFA
// ============================================================================
void MultiPatternMatcher::BuildFailureLinks() {
    queue<uint32_t> pending;

    // 根的直接子节点失败链接指向根；缺失转移保持为 0（回到根）
    for (int b = 0; b < 256; b++) {
        uint32_t child = nodes[0].next[b];
        if (child != 0) {
            nodes[child].failure = 0;
            pending.push(child);
        }
    }

    while (!pending.empty()) {
        uint32_t u = pending.front();
        pending.pop();

        // 失败节点深度更小，已先出队，其输出已合并完整
        uint32_t fail = nodes[u].failure;
        const vector<uint32_t>& inherited = nodes[fail].outputs;
        nodes[u].outputs.insert(nodes[u].outputs.end(), inherited.begin(), inherited.end());

        for (int b = 0; b < 256; b++) {
            uint32_t v = nodes[u].next[b];
            if (v != 0) {
                nodes[v].failure = nodes[fail].next[b];
                pending.push(v);
            } else {
                nodes[u].next[b] = nodes[fail].next[b];
            }
        }
    }
}

// ============================================================================
// 扫描窗口
// ============================================================================
void MultiPatternMatcher::Scan(const WindowView& view, vector<MatchEvent>& events) const {
    if (view.size == 0 || view.settledLength == 0) {
        return;
    }

    vector<MatchEvent> found;
    uint32_t state = 0;

    for (size_t i = 0; i < view.size; i++) {
        state = nodes[state].next[view.data[i]];

        const vector<uint32_t>& outputs = nodes[state].outputs;
        if (outputs.empty()) {
            continue;
        }

        for (uint32_t patternId : outputs) {
            const PatternEntry& entry = patterns[patternId];
            const BytePattern& pattern = *entry.pattern;

            size_t anchorStart = i + 1 - pattern.AnchorLength();
            if (anchorStart < pattern.AnchorOffset()) {
                continue;   // 模式起点在窗口之前
            }
            size_t start = anchorStart - pattern.AnchorOffset();

            // 只处理起始位置在本次确定区间内的匹配
            if (start >= view.settledLength) {
                continue;
            }
            if (start + pattern.Length() > view.size) {
                continue;
            }
            if (!pattern.MatchesAt(view.data + start, view.size - start)) {
                continue;
            }

            MatchEvent event;
            event.signature = entry.signature;
            event.typeIndex = entry.typeIndex;
            event.kind = entry.kind;
            event.absoluteOffset = view.absoluteOffset + start;
            event.patternLength = pattern.Length();
            found.push_back(event);
        }
    }

    ResolveTies(found);
    events.insert(events.end(), found.begin(), found.end());
}

// ============================================================================
// 排序并处理同一偏移的文件头冲突
// 顺序：偏移升序；同偏移时文件尾在前；文件头按具体程度（字面量字节数、
// 模式长度）降序，再按声明顺序
// ============================================================================
void MultiPatternMatcher::ResolveTies(vector<MatchEvent>& events) {
    if (events.size() < 2) {
        return;
    }

    sort(events.begin(), events.end(), [](const MatchEvent& a, const MatchEvent& b) {
        if (a.absoluteOffset != b.absoluteOffset) {
            return a.absoluteOffset < b.absoluteOffset;
        }
        if (a.kind != b.kind) {
            return a.kind == MatchKind::Footer;
        }
        if (a.kind == MatchKind::Header) {
            size_t aLiteral = a.signature->header.LiteralCount();
            size_t bLiteral = b.signature->header.LiteralCount();
            if (aLiteral != bLiteral) {
                return aLiteral > bLiteral;
            }
            if (a.patternLength != b.patternLength) {
                return a.patternLength > b.patternLength;
            }
        }
        return a.typeIndex < b.typeIndex;
    });

    vector<MatchEvent> resolved;
    resolved.reserve(events.size());
    for (const MatchEvent& event : events) {
        if (event.kind == MatchKind::Header && !resolved.empty()) {
            const MatchEvent& prev = resolved.back();
            if (prev.kind == MatchKind::Header && prev.absoluteOffset == event.absoluteOffset) {
                LOG_DEBUG_FMT("Header '%s' at %llu superseded by '%s'",
                              event.TypeId().c_str(), (unsigned long long)event.absoluteOffset,
                              prev.TypeId().c_str());
                continue;
            }
        }
        resolved.push_back(event);
    }

    events.swap(resolved);
}
