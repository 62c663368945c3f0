#pragma once
#include "PlatformConfig.h"
#include "Result.h"
#include "CarveRunner.h"
#include <nlohmann/json.hpp>
#include <string>

using namespace std;

namespace ReportWriter {
    // 运行报告 -> JSON
    nlohmann::json ToJson(const CarveReport& report);

    // 写入 JSON 文件（缩进 2 空格）
    RC::Result<void> WriteJson(const CarveReport& report, const string& path);
}
