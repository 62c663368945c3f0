#include "CarveEngine.h"
#include "Logger.h"

CarveEngine::CarveEngine(const SignatureCatalog& sigCatalog)
    : catalog(sigCatalog),
      window(sigCatalog.MaxPatternLength() > 0 ? sigCatalog.MaxPatternLength() - 1 : 0),
      matcher(sigCatalog),
      tracker(sigCatalog),
      cancelled(false) {
    LOG_DEBUG_FMT("Carve engine created: %zu signatures, tail %zu bytes",
                  catalog.Size(), window.TailLength());
}

RC::Result<void> CarveEngine::Advance(const BYTE* chunk, size_t size) {
    if (cancelled) {
        return RC::Result<void>::Failure(RC::ErrorInfo(
            RC::ErrorCode::LogicOperationCancelled, "carve engine was cancelled",
            "offset " + to_string(window.StreamPosition())));
    }

    // 窗口推进失败时直接返回，匹配器和跟踪器都未被触及
    auto advanced = window.Advance(chunk, size);
    if (advanced.IsFailure()) {
        return advanced;
    }

    WindowView view = window.View();

    events.clear();
    matcher.Scan(view, events);

    for (const MatchEvent& event : events) {
        if (event.kind == MatchKind::Header) {
            stats.headerMatches++;
        } else {
            stats.footerMatches++;
        }
        if (matchObserver) {
            matchObserver(event);
        }
        tracker.OnMatch(event);
    }

    // 已确定前缀内的匹配都已送达
    tracker.AdvanceTo(view.SettledEndOffset());

    if (view.endOfStream) {
        tracker.Finish(window.StreamPosition());
        LOG_DEBUG_FMT("Carve engine reached end of stream: %llu bytes, %llu headers, %llu footers",
                      (unsigned long long)window.StreamPosition(),
                      (unsigned long long)stats.headerMatches,
                      (unsigned long long)stats.footerMatches);
    } else {
        stats.chunksProcessed++;
    }

    stats.bytesScanned = window.StreamPosition();
    return RC::Result<void>::Success();
}

RC::Result<void> CarveEngine::Finish() {
    return Advance(nullptr, 0);
}

void CarveEngine::Cancel() {
    if (cancelled) {
        return;
    }
    cancelled = true;
    tracker.Cancel();
}

CarveEngineStats CarveEngine::GetStats() const {
    CarveEngineStats result = stats;
    result.tracker = tracker.GetStats();
    return result;
}
