#pragma once
#include "PlatformConfig.h"
#include <string>
#include <chrono>
#include <ostream>

using namespace std;

// 控制台进度条工具类（以字节为单位）
class ProgressBar
{
private:
    ULONGLONG total;           // 总字节数
    ULONGLONG current;         // 当前进度
    ULONGLONG extraInfo;       // 额外信息(找到的文件数)
    int barWidth;              // 进度条宽度
    ostream& out;
    chrono::steady_clock::time_point startTime;  // 开始时间
    chrono::steady_clock::time_point lastUpdate; // 上次更新时间
    bool isVisible;            // 是否显示
    bool rendered;             // 是否已输出过

    // 内部渲染方法
    void Render();

    // 计算速度(每秒字节数)
    ULONGLONG GetSpeed() const;

public:
    ProgressBar(ULONGLONG totalBytes, int width = 40);
    ProgressBar(ULONGLONG totalBytes, int width, ostream& stream);
    ~ProgressBar();

    // 更新进度
    void Update(ULONGLONG currentBytes, ULONGLONG extra = 0);

    // 完成进度条
    void Finish();

    // 显示/隐藏
    void Show() { isVisible = true; }
    void Hide() { isVisible = false; }

    // 格式化大数字(添加千位分隔符)
    static string FormatNumber(ULONGLONG num);

    // 格式化字节数（B/KB/MB/GB）
    static string FormatBytes(ULONGLONG bytes);
};
