#pragma once
#include "PlatformConfig.h"
#include "Result.h"
#include "SignatureCatalog.h"
#include "CatalogLoader.h"
#include "CarveRunner.h"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

using namespace std;

// 退出码
enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,             // 参数或配置错误
    EXIT_SCAN_ABORTED = 2,      // 读取失败导致扫描中止
    EXIT_PARTIAL = 3            // 扫描完成，但部分文件提取失败
};

// ============================================================================
// 命令行选项
// ============================================================================
struct CommandLineOptions {
    string command;                     // carve / types / help
    string inputPath;
    string outputDir;
    string catalogPath;
    string reportPath;
    string logPath;
    vector<string> types;               // 为空 = 全部类型
    optional<size_t> chunkSizeMiB;
    optional<ULONGLONG> segmentSizeMiB;
    optional<int> threads;
    optional<size_t> maxResults;
    bool extract = true;
    bool verbose = false;
    bool quiet = false;                 // 不显示进度条
};

// ============================================================================
// 命令实现
// ============================================================================
class CarveCommand {
public:
    // 解析 argv[1..]
    static RC::Result<CommandLineOptions> ParseArguments(const vector<string>& args);

    // 执行命令，返回退出码
    static int Execute(const CommandLineOptions& options, ostream& out);

    // rawcarve carve ...
    static int ExecuteCarve(const CommandLineOptions& options, ostream& out);

    // rawcarve types ...
    static int ExecuteTypes(const CommandLineOptions& options, ostream& out);

    static void PrintUsage(ostream& out);

    // 加载签名库（内置或 --catalog），并按 --types 过滤
    static RC::Result<SignatureCatalog> LoadCatalog(const CommandLineOptions& options,
                                                    CatalogConfig& configOut);

    // 默认值 < 配置文件 engine 段 < 命令行
    static CarveRunConfig BuildRunConfig(const CommandLineOptions& options,
                                         const EngineSettings& settings);

    // 请求正在运行的扫描停止（信号处理中调用）
    static void RequestStop();
};
