#include "ByteSource.h"
#include "Logger.h"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>

// ============================================================================
// FileByteSource
// ============================================================================
FileByteSource::FileByteSource(const string& filePath, ULONGLONG fileLength)
    : path(filePath), length(fileLength) {
}

RC::Result<unique_ptr<FileByteSource>> FileByteSource::Open(const string& filePath) {
    error_code ec;
    if (!filesystem::exists(filePath, ec)) {
        return RC::Result<unique_ptr<FileByteSource>>::Failure(RC::ErrorInfo(
            RC::ErrorCode::IOHandleInvalid, "input not found", filePath));
    }

    unique_ptr<FileByteSource> source(new FileByteSource(filePath, 0));
    source->stream.open(filePath, ios::binary | ios::in);
    if (!source->stream.is_open()) {
        return RC::Result<unique_ptr<FileByteSource>>::Failure(
            RC::MakeSystemError(RC::ErrorCode::IOHandleInvalid, "cannot open input", filePath));
    }

    source->stream.seekg(0, ios::end);
    streamoff end = source->stream.tellg();
    if (end < 0) {
        return RC::Result<unique_ptr<FileByteSource>>::Failure(
            RC::MakeSystemError(RC::ErrorCode::IOSeekFailed, "cannot determine input length", filePath));
    }
    source->length = static_cast<ULONGLONG>(end);
    source->stream.seekg(0, ios::beg);

    LOG_INFO_FMT("Opened input %s (%llu bytes)", filePath.c_str(), (unsigned long long)source->length);
    return RC::Result<unique_ptr<FileByteSource>>::Success(move(source));
}

RC::Result<size_t> FileByteSource::ReadAt(ULONGLONG offset, BYTE* buffer, size_t size) {
    if (buffer == nullptr && size > 0) {
        return RC::Result<size_t>::Failure(RC::ErrorCode::LogicInvalidArgument, "null read buffer");
    }
    if (offset >= length || size == 0) {
        return RC::Result<size_t>::Success(0);
    }

    size_t toRead = static_cast<size_t>(min<ULONGLONG>(size, length - offset));

    lock_guard<mutex> lock(readMutex);

    stream.clear();
    stream.seekg(static_cast<streamoff>(offset), ios::beg);
    if (!stream) {
        return RC::Result<size_t>::Failure(RC::MakeSystemError(
            RC::ErrorCode::IOSeekFailed, "seek failed", path + " @" + to_string(offset)));
    }

    stream.read(reinterpret_cast<char*>(buffer), static_cast<streamsize>(toRead));
    streamsize got = stream.gcount();
    if (got <= 0 || (!stream && !stream.eof())) {
        return RC::Result<size_t>::Failure(RC::MakeSystemError(
            RC::ErrorCode::IOReadFailed, "read failed", path + " @" + to_string(offset)));
    }

    return RC::Result<size_t>::Success(static_cast<size_t>(got));
}

// ============================================================================
// MemoryByteSource
// ============================================================================
MemoryByteSource::MemoryByteSource(vector<BYTE> bytes, const string& sourceName)
    : data(move(bytes)), name(sourceName) {
}

RC::Result<size_t> MemoryByteSource::ReadAt(ULONGLONG offset, BYTE* buffer, size_t size) {
    if (buffer == nullptr && size > 0) {
        return RC::Result<size_t>::Failure(RC::ErrorCode::LogicInvalidArgument, "null read buffer");
    }
    if (offset >= data.size() || size == 0) {
        return RC::Result<size_t>::Success(0);
    }

    size_t toRead = static_cast<size_t>(min<ULONGLONG>(size, data.size() - offset));
    memcpy(buffer, data.data() + offset, toRead);
    return RC::Result<size_t>::Success(toRead);
}
