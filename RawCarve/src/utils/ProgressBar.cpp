#include "ProgressBar.h"
#include <iostream>
#include <iomanip>
#include <sstream>

using namespace std;

ProgressBar::ProgressBar(ULONGLONG totalBytes, int width)
    : ProgressBar(totalBytes, width, cout) {
}

ProgressBar::ProgressBar(ULONGLONG totalBytes, int width, ostream& stream)
    : total(totalBytes), current(0), extraInfo(0), barWidth(width), out(stream),
      isVisible(true), rendered(false) {
    startTime = chrono::steady_clock::now();
    lastUpdate = startTime;
}

ProgressBar::~ProgressBar() {
    if (isVisible && rendered) {
        out << endl;  // 确保进度条后换行
    }
}

void ProgressBar::Update(ULONGLONG currentBytes, ULONGLONG extra) {
    current = currentBytes;
    extraInfo = extra;

    // 限制更新频率(每100ms更新一次)
    auto now = chrono::steady_clock::now();
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(now - lastUpdate).count();

    if (elapsed < 100 && current < total) {
        return;
    }

    lastUpdate = now;

    if (isVisible) {
        Render();
    }
}

void ProgressBar::Finish() {
    current = total;
    if (isVisible) {
        Render();
        out << endl;
        rendered = false;
    }
}

void ProgressBar::Render() {
    double percentage = (total > 0) ? (double)current / total * 100.0 : 100.0;
    int filled = (total > 0) ? (int)((double)current / total * barWidth) : barWidth;

    ULONGLONG speed = GetSpeed();

    out << "\r";

    out << fixed << setprecision(1) << setw(5) << percentage << "% ";

    // 进度条 [=========>     ]
    out << "[";
    for (int i = 0; i < barWidth; i++) {
        if (i < filled - 1) {
            out << "=";
        } else if (i == filled - 1 && filled < barWidth) {
            out << ">";
        } else if (i < filled) {
            out << "=";
        } else {
            out << " ";
        }
    }
    out << "] ";

    out << FormatBytes(current) << "/" << FormatBytes(total);

    if (extraInfo > 0) {
        out << " | Found: " << FormatNumber(extraInfo);
    }

    if (speed > 0) {
        out << " | " << FormatBytes(speed) << "/s";
    }

    // 清除行尾多余字符
    out << "   " << flush;
    rendered = true;
}

string ProgressBar::FormatNumber(ULONGLONG num) {
    string digits = to_string(num);
    string result;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            result.insert(result.begin(), ',');
        }
        result.insert(result.begin(), *it);
        count++;
    }
    return result;
}

string ProgressBar::FormatBytes(ULONGLONG bytes) {
    const char* units[] = { "B", "KB", "MB", "GB", "TB" };
    double value = (double)bytes;
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }

    stringstream ss;
    if (unit == 0) {
        ss << bytes << " B";
    } else {
        ss << fixed << setprecision(1) << value << " " << units[unit];
    }
    return ss.str();
}

ULONGLONG ProgressBar::GetSpeed() const {
    auto now = chrono::steady_clock::now();
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(now - startTime).count();

    if (elapsed < 1000 || current == 0) {
        return 0;  // 前1秒不显示速度
    }

    return (ULONGLONG)((double)current / elapsed * 1000.0);
}
