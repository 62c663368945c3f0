#include "ReportWriter.h"
#include "Logger.h"
#include <fstream>

using json = nlohmann::json;

namespace {

json ErrorToJson(const RC::ErrorInfo& error) {
    json j;
    j["code"] = static_cast<uint32_t>(error.code);
    j["name"] = error.GetErrorCodeName();
    j["category"] = error.GetCategory();
    j["message"] = error.message;
    j["context"] = error.context;
    return j;
}

} // namespace

namespace ReportWriter {

json ToJson(const CarveReport& report) {
    json j;
    j["source"] = report.source;
    j["sourceLength"] = report.sourceLength;
    j["bytesScanned"] = report.bytesScanned;
    j["elapsedSeconds"] = report.elapsedSeconds;
    j["workers"] = report.workersUsed;
    j["cancelled"] = report.cancelled;
    j["aborted"] = report.aborted;
    j["truncated"] = report.truncated;
    j["abortError"] = report.aborted ? ErrorToJson(report.abortError) : json(nullptr);

    j["files"] = json::array();
    for (const auto& file : report.files) {
        json f;
        f["type"] = file.typeId;
        f["extension"] = file.extension;
        f["description"] = file.description;
        f["start"] = file.startOffset;
        f["end"] = file.endOffset;
        f["length"] = file.Length();
        f["footerFound"] = file.footerFound;
        f["output"] = file.outputName.empty() ? json(nullptr) : json(file.outputName);
        j["files"].push_back(f);
    }

    j["failures"] = json::array();
    for (const auto& failure : report.failures) {
        json f;
        f["type"] = failure.typeId;
        f["start"] = failure.startOffset;
        f["end"] = failure.endOffset;
        f["error"] = ErrorToJson(failure.error);
        j["failures"].push_back(f);
    }

    const TrackerStats& t = report.stats.tracker;
    j["discarded"] = {
        { "total", t.sessionsDiscarded },
        { "exceededMaxSize", t.discardedExceededMaxSize },
        { "footerBeyondMaxSize", t.discardedFooterBeyondMaxSize },
        { "incompleteAtEnd", t.discardedIncomplete },
        { "cancelled", t.discardedCancelled }
    };

    j["stats"] = {
        { "chunks", report.stats.chunksProcessed },
        { "headerMatches", report.stats.headerMatches },
        { "footerMatches", report.stats.footerMatches },
        { "headersNested", t.headersNested },
        { "footersUnmatched", t.footersUnmatched },
        { "sessionsOpened", t.sessionsOpened },
        { "sessionsFinalized", t.sessionsFinalized }
    };

    return j;
}

RC::Result<void> WriteJson(const CarveReport& report, const string& path) {
    ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR_FMT("Cannot create report file: %s", path.c_str());
        return RC::Result<void>::Failure(
            RC::MakeSystemError(RC::ErrorCode::IOWriteFailed, "cannot create report file", path));
    }

    try {
        file << ToJson(report).dump(2);
    } catch (const json::exception& e) {
        LOG_ERROR_FMT("Cannot serialize report: %s", e.what());
        return RC::Result<void>::Failure(RC::ErrorInfo(
            RC::ErrorCode::IOWriteFailed, string("cannot serialize report: ") + e.what(), path));
    }
    file.close();
    if (file.fail()) {
        return RC::Result<void>::Failure(
            RC::MakeSystemError(RC::ErrorCode::IOWriteFailed, "cannot write report file", path));
    }

    LOG_INFO_FMT("Report written: %s", path.c_str());
    return RC::Result<void>::Success();
}

} // namespace ReportWriter
