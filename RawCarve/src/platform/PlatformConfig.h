#pragma once

// ============================================================================
// 平台检测和配置
// ============================================================================

// 平台检测
#if defined(_WIN32) || defined(_WIN64)
    #define RC_PLATFORM_WINDOWS 1
    #define RC_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define RC_PLATFORM_LINUX 1
    #define RC_PLATFORM_NAME "Linux"
#elif defined(__APPLE__) && defined(__MACH__)
    #define RC_PLATFORM_MACOS 1
    #define RC_PLATFORM_NAME "macOS"
#elif defined(__FreeBSD__)
    #define RC_PLATFORM_FREEBSD 1
    #define RC_PLATFORM_NAME "FreeBSD"
#else
    #define RC_PLATFORM_UNKNOWN 1
    #define RC_PLATFORM_NAME "Unknown"
#endif

// 架构检测
#if defined(_M_X64) || defined(__x86_64__) || defined(__amd64__)
    #define RC_ARCH_X64 1
    #define RC_ARCH_NAME "x64"
#elif defined(_M_IX86) || defined(__i386__)
    #define RC_ARCH_X86 1
    #define RC_ARCH_NAME "x86"
#elif defined(_M_ARM64) || defined(__aarch64__)
    #define RC_ARCH_ARM64 1
    #define RC_ARCH_NAME "ARM64"
#elif defined(_M_ARM) || defined(__arm__)
    #define RC_ARCH_ARM 1
    #define RC_ARCH_NAME "ARM"
#else
    #define RC_ARCH_UNKNOWN 1
    #define RC_ARCH_NAME "Unknown"
#endif

// 编译器检测
#if defined(_MSC_VER)
    #define RC_COMPILER_MSVC 1
    #define RC_COMPILER_NAME "MSVC"
#elif defined(__clang__)
    #define RC_COMPILER_CLANG 1
    #define RC_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
    #define RC_COMPILER_GCC 1
    #define RC_COMPILER_NAME "GCC"
#else
    #define RC_COMPILER_UNKNOWN 1
    #define RC_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// 平台特定包含
// ============================================================================

#ifdef RC_PLATFORM_WINDOWS
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <Windows.h>
#endif

// ============================================================================
// 跨平台类型定义
// ============================================================================

#include <cstdint>
#include <cstddef>

// 扫描代码统一使用 BYTE / ULONGLONG，非 Windows 平台在此补齐
#ifndef RC_PLATFORM_WINDOWS
typedef std::uint8_t  BYTE;
typedef std::uint32_t DWORD;
typedef std::uint64_t ULONGLONG;
#endif

namespace Platform {

using UInt8 = std::uint8_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeType = std::size_t;

// 流内绝对偏移和长度
using StreamOffset = UInt64;
using StreamLength = UInt64;

// 获取平台名称
inline const char* GetPlatformName() {
    return RC_PLATFORM_NAME;
}

// 获取架构名称
inline const char* GetArchName() {
    return RC_ARCH_NAME;
}

// 获取编译器名称
inline const char* GetCompilerName() {
    return RC_COMPILER_NAME;
}

// 检查是否为 64 位平台
inline bool Is64Bit() {
#if defined(RC_ARCH_X64) || defined(RC_ARCH_ARM64)
    return true;
#else
    return false;
#endif
}

} // namespace Platform
