#include "DirectoryArtifactSink.h"
#include "Logger.h"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

DirectoryArtifactSink::DirectoryArtifactSink(const string& dir)
    : directory(dir), active(false), committedCount(0) {
}

DirectoryArtifactSink::~DirectoryArtifactSink() {
    if (active) {
        Abort();
    }
}

RC::Result<unique_ptr<DirectoryArtifactSink>> DirectoryArtifactSink::Create(const string& dir) {
    error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir)) {
        return RC::Result<unique_ptr<DirectoryArtifactSink>>::Failure(RC::ErrorInfo(
            RC::ErrorCode::IOWriteFailed,
            "cannot create output directory" + (ec ? ": " + ec.message() : string()),
            dir, static_cast<uint32_t>(ec.value())));
    }

    LOG_INFO_FMT("Output directory: %s", dir.c_str());
    return RC::Result<unique_ptr<DirectoryArtifactSink>>::Success(
        unique_ptr<DirectoryArtifactSink>(new DirectoryArtifactSink(dir)));
}

string DirectoryArtifactSink::MakeFileName(const CarveSession& session) {
    return "recovered_" + to_string(session.startOffset) + "_" + session.TypeId() +
           "." + session.signature->Extension();
}

RC::Result<void> DirectoryArtifactSink::Begin(const CarveSession& session) {
    if (active) {
        Abort();
    }

    fileName = MakeFileName(session);
    finalPath = (fs::path(directory) / fileName).string();
    partPath = finalPath + ".part";

    current.open(partPath, ios::binary | ios::out | ios::trunc);
    if (!current.is_open()) {
        return RC::Result<void>::Failure(
            RC::MakeSystemError(RC::ErrorCode::IOWriteFailed, "cannot create output file", partPath));
    }

    active = true;
    return RC::Result<void>::Success();
}

RC::Result<void> DirectoryArtifactSink::Write(const BYTE* data, size_t size) {
    if (!active) {
        return RC::Result<void>::Failure(RC::ErrorCode::LogicInvalidArgument, "write without an open artifact");
    }

    current.write(reinterpret_cast<const char*>(data), static_cast<streamsize>(size));
    if (!current) {
        return RC::Result<void>::Failure(
            RC::MakeSystemError(RC::ErrorCode::IOWriteFailed, "write failed", partPath));
    }
    return RC::Result<void>::Success();
}

RC::Result<string> DirectoryArtifactSink::Commit() {
    if (!active) {
        return RC::Result<string>::Failure(RC::ErrorCode::LogicInvalidArgument, "commit without an open artifact");
    }

    current.close();
    if (current.fail()) {
        return RC::Result<string>::Failure(
            RC::MakeSystemError(RC::ErrorCode::IOWriteFailed, "close failed", partPath));
    }

    error_code ec;
    fs::rename(partPath, finalPath, ec);
    if (ec) {
        return RC::Result<string>::Failure(RC::ErrorInfo(
            RC::ErrorCode::IOWriteFailed, "rename failed: " + ec.message(), finalPath,
            static_cast<uint32_t>(ec.value())));
    }

    active = false;
    partPath.clear();
    committedCount++;
    return RC::Result<string>::Success(fileName);
}

void DirectoryArtifactSink::Abort() {
    if (current.is_open()) {
        current.close();
    }
    current.clear();

    if (!partPath.empty()) {
        error_code ec;
        fs::remove(partPath, ec);
        if (ec) {
            LOG_WARNING_FMT("Cannot remove partial file %s: %s", partPath.c_str(), ec.message().c_str());
        }
    }
    active = false;
}
