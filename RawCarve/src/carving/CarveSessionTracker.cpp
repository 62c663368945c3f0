#include "CarveSessionTracker.h"
#include "Logger.h"
#include <algorithm>

const char* DiscardReasonName(DiscardReason reason) {
    switch (reason) {
    case DiscardReason::None:                return "none";
    case DiscardReason::ExceededMaxSize:     return "exceeded max size without footer";
    case DiscardReason::FooterBeyondMaxSize: return "footer beyond max size";
    case DiscardReason::IncompleteAtEnd:     return "incomplete at end of stream";
    case DiscardReason::Cancelled:           return "scan cancelled";
    default:                                 return "unknown";
    }
}

CarveSessionTracker::CarveSessionTracker(const SignatureCatalog& sigCatalog)
    : catalog(sigCatalog), position(0), finished(false) {
    claimedUntil.assign(catalog.Size(), 0);
}

void CarveSessionTracker::ClaimUntil(size_t typeIndex, ULONGLONG claimEnd) {
    if (typeIndex < claimedUntil.size()) {
        claimedUntil[typeIndex] = max(claimedUntil[typeIndex], claimEnd);
    }
}

// ============================================================================
// 匹配事件
// ============================================================================
void CarveSessionTracker::OnMatch(const MatchEvent& event) {
    if (finished) {
        return;
    }

    // 先结算到事件位置：在此之前已到期的会话不能再阻挡新文件头
    AdvanceTo(event.absoluteOffset);

    if (event.kind == MatchKind::Header) {
        HandleHeader(event);
    } else {
        HandleFooter(event);
    }

    CollectResolved();
    ReleaseReady();
}

void CarveSessionTracker::HandleHeader(const MatchEvent& event) {
    stats.headersSeen++;
    const SignatureDefinition& def = *event.signature;

    if (!def.allowOverlap) {
        // 先打开者优先：同类型已有打开的会话时忽略嵌套文件头
        for (const CarveSession& open : openSessions) {
            if (open.typeIndex == event.typeIndex) {
                stats.headersNested++;
                LOG_DEBUG_FMT("Nested '%s' header at %llu ignored (session open at %llu)",
                              def.typeId.c_str(), (unsigned long long)event.absoluteOffset,
                              (unsigned long long)open.startOffset);
                return;
            }
        }

        // 落在同类型已完成范围内的文件头同样视为嵌套
        if (event.absoluteOffset < claimedUntil[event.typeIndex]) {
            stats.headersNested++;
            LOG_DEBUG_FMT("Nested '%s' header at %llu ignored (inside claimed range ending at %llu)",
                          def.typeId.c_str(), (unsigned long long)event.absoluteOffset,
                          (unsigned long long)claimedUntil[event.typeIndex]);
            return;
        }
    }

    CarveSession session;
    session.signature = event.signature;
    session.typeIndex = event.typeIndex;
    session.startOffset = event.absoluteOffset;
    session.state = SessionState::Open;
    openSessions.push_back(session);
    stats.sessionsOpened++;
}

void CarveSessionTracker::HandleFooter(const MatchEvent& event) {
    stats.footersSeen++;
    bool consumed = false;

    for (CarveSession& session : openSessions) {
        if (session.state != SessionState::Open || session.typeIndex != event.typeIndex) {
            continue;
        }

        const SignatureDefinition& def = *session.signature;
        if (def.sizePolicy == SizePolicy::FixedLength) {
            continue;
        }

        // 文件尾必须位于文件头之后
        if (event.absoluteOffset < session.startOffset + def.header.Length()) {
            continue;
        }

        ULONGLONG end = (def.footerMode == FooterMode::Inclusive)
            ? event.absoluteOffset + event.patternLength
            : event.absoluteOffset;
        if (end <= session.startOffset) {
            continue;
        }

        consumed = true;
        ULONGLONG limit = catalog.EffectiveMaxSize(def);
        if (end - session.startOffset <= limit) {
            Finalize(session, end, true);
        } else if (def.sizePolicy == SizePolicy::FooterTerminated) {
            Discard(session, DiscardReason::FooterBeyondMaxSize, event.absoluteOffset);
        }
        // MaxSizeCapped：文件尾超出上限时仍按上限截断，交给 AdvanceTo
    }

    if (!consumed) {
        stats.footersUnmatched++;
    }
}

// ============================================================================
// 位置推进
// ============================================================================
void CarveSessionTracker::AdvanceTo(ULONGLONG p) {
    if (finished || p < position) {
        return;
    }
    position = p;

    // 会话起点都不超过 position，用差值比较避免 startOffset + size 溢出
    for (CarveSession& session : openSessions) {
        if (session.state != SessionState::Open) {
            continue;
        }

        const SignatureDefinition& def = *session.signature;
        ULONGLONG limit = catalog.EffectiveMaxSize(def);
        if (p < session.startOffset) {
            continue;
        }
        ULONGLONG elapsed = p - session.startOffset;

        switch (def.sizePolicy) {
        case SizePolicy::FixedLength:
            if (elapsed >= def.fixedSize) {
                Finalize(session, session.startOffset + def.fixedSize, false);
            }
            break;

        case SizePolicy::MaxSizeCapped:
            if (elapsed >= limit) {
                Finalize(session, session.startOffset + limit, false);
            }
            break;

        case SizePolicy::FooterTerminated:
            // 之后的文件尾起点 >= p，结果必然超过上限；
            // 起点不超过 start + limit 的文件头在此之前已被挡住
            if (elapsed > limit) {
                Discard(session, DiscardReason::ExceededMaxSize, session.startOffset + limit + 1);
            }
            break;
        }
    }

    CollectResolved();
    ReleaseReady();
}

void CarveSessionTracker::Finish(ULONGLONG streamLength) {
    if (finished) {
        return;
    }

    AdvanceTo(streamLength);

    for (CarveSession& session : openSessions) {
        if (session.state == SessionState::Open) {
            Discard(session, DiscardReason::IncompleteAtEnd, streamLength);
        }
    }
    CollectResolved();

    finished = true;
    ReleaseReady();

    LOG_DEBUG_FMT("Session tracker finished at %llu: %llu finalized, %llu discarded",
                  (unsigned long long)streamLength,
                  (unsigned long long)stats.sessionsFinalized,
                  (unsigned long long)stats.sessionsDiscarded);
}

void CarveSessionTracker::Cancel() {
    if (finished) {
        return;
    }

    for (CarveSession& session : openSessions) {
        if (session.state == SessionState::Open) {
            Discard(session, DiscardReason::Cancelled, position);
        }
    }
    CollectResolved();

    // 已完成的会话是完整的，照常输出
    finished = true;
    ReleaseReady();

    LOG_INFO_FMT("Session tracker cancelled at %llu", (unsigned long long)position);
}

// ============================================================================
// 状态转换
// ============================================================================
void CarveSessionTracker::Finalize(CarveSession& session, ULONGLONG endOffset, bool footerFound) {
    session.state = SessionState::Finalized;
    session.endOffset = endOffset;
    session.footerFound = footerFound;

    ULONGLONG& claimed = claimedUntil[session.typeIndex];
    claimed = max(claimed, endOffset);

    stats.sessionsFinalized++;
    if (resolvedObserver) {
        resolvedObserver(session, endOffset);
    }

    LOG_DEBUG_FMT("Finalized '%s' session [%llu, %llu)%s",
                  session.TypeId().c_str(), (unsigned long long)session.startOffset,
                  (unsigned long long)endOffset, footerFound ? " with footer" : "");
}

void CarveSessionTracker::Discard(CarveSession& session, DiscardReason reason, ULONGLONG claimEnd) {
    session.state = SessionState::Discarded;
    session.discardReason = reason;

    stats.sessionsDiscarded++;
    switch (reason) {
    case DiscardReason::ExceededMaxSize:     stats.discardedExceededMaxSize++; break;
    case DiscardReason::FooterBeyondMaxSize: stats.discardedFooterBeyondMaxSize++; break;
    case DiscardReason::IncompleteAtEnd:     stats.discardedIncomplete++; break;
    case DiscardReason::Cancelled:           stats.discardedCancelled++; break;
    default: break;
    }
    if (resolvedObserver) {
        resolvedObserver(session, claimEnd);
    }

    LOG_DEBUG_FMT("Discarded '%s' session at %llu: %s",
                  session.TypeId().c_str(), (unsigned long long)session.startOffset,
                  DiscardReasonName(reason));
}

void CarveSessionTracker::CollectResolved() {
    auto it = openSessions.begin();
    while (it != openSessions.end()) {
        if (it->state == SessionState::Finalized) {
            finalizedPending.emplace(make_pair(it->startOffset, it->typeIndex), *it);
            it = openSessions.erase(it);
        } else if (it->state == SessionState::Discarded) {
            it = openSessions.erase(it);
        } else {
            ++it;
        }
    }
}

void CarveSessionTracker::ReleaseReady() {
    while (!finalizedPending.empty()) {
        auto first = finalizedPending.begin();
        if (!openSessions.empty() && openSessions.front().startOffset < first->first.first) {
            break;
        }
        ready.push_back(first->second);
        finalizedPending.erase(first);
    }
}

optional<CarveSession> CarveSessionTracker::PopFinalized() {
    if (ready.empty()) {
        return nullopt;
    }
    CarveSession session = ready.front();
    ready.pop_front();
    return session;
}
