#include <iostream>
#include <string>
#include <vector>
#include <csignal>
#include "CarveCommand.h"
#include "Logger.h"
using namespace std;

// Ctrl+C：请求正在运行的扫描停止，已完成的文件照常输出
static void HandleInterrupt(int) {
    CarveCommand::RequestStop();
}

int main(int argc, char* argv[])
{
    vector<string> args(argv + 1, argv + argc);

    auto parsed = CarveCommand::ParseArguments(args);
    if (parsed.IsFailure()) {
        cerr << "Error: " << parsed.Error().message << endl;
        cerr << "Run 'rawcarve help' for usage." << endl;
        return EXIT_USAGE;
    }
    const CommandLineOptions& options = parsed.Value();

    if (options.command == "help") {
        CarveCommand::PrintUsage(cout);
        return EXIT_OK;
    }

    // ========== 初始化日志系统 ==========
    Logger& logger = Logger::GetInstance();
    string logPath = options.logPath.empty() ? "rawcarve.log" : options.logPath;
    logger.Initialize(logPath, options.verbose ? LOG_DEBUG : LOG_INFO);
    logger.SetConsoleOutput(false);  // 避免干扰进度条
    logger.SetFileOutput(true);

    LOG_INFO("==============================================");
    LOG_INFO_FMT("RawCarve started: %s (%s, %s, %s)", options.command.c_str(),
                 Platform::GetPlatformName(), Platform::GetArchName(), Platform::GetCompilerName());
    LOG_INFO("==============================================");

    signal(SIGINT, HandleInterrupt);

    int exitCode = EXIT_USAGE;
    try {
        exitCode = CarveCommand::Execute(options, cout);
    }
    catch (const exception& e) {
        cout << "Error executing command: " << e.what() << endl;
        LOG_ERROR_FMT("Exception in command execution: %s", e.what());
        exitCode = EXIT_USAGE;
    }

    LOG_INFO_FMT("RawCarve finished with exit code %d", exitCode);
    logger.Close();
    return exitCode;
}
