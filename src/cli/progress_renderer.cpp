#include "cli/progress_renderer.h"
#include <iomanip>
#include <sstream>
#include <cmath>
#include <algorithm>

namespace airdl {
namespace cli {

ProgressRenderer::ProgressRenderer(std::ostream& out)
    : out_(out)
    , start_time_(std::chrono::steady_clock::now())
{
}

void ProgressRenderer::start(const std::string& label) {
    label_ = label;
    start_time_ = std::chrono::steady_clock::now();
    last_length_ = 0;
    active_ = true;
}

void ProgressRenderer::update(uint64_t downloaded_bytes, uint64_t total_bytes) {
    if (!active_) {
        return;
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
    double speed = elapsed > 0.0 ? static_cast<double>(downloaded_bytes) / elapsed : 0.0;
    clearAndPrint(formatLine(label_, downloaded_bytes, total_bytes, speed));
}

void ProgressRenderer::complete(const std::string& saved_path, uint64_t bytes, double seconds) {
    if (active_ && last_length_ > 0) {
        out_ << "\n";
    }
    active_ = false;
    out_ << formatSaved(saved_path, bytes, seconds) << std::endl;
}

void ProgressRenderer::fail(const std::string& error_message) {
    if (active_ && last_length_ > 0) {
        out_ << "\n";
    }
    active_ = false;

    std::ostringstream oss;
    if (!label_.empty()) {
        oss << label_ << " ";
    }
    oss << "failed: " << error_message;
    out_ << oss.str() << std::endl;
}

std::string ProgressRenderer::formatLine(const std::string& label, uint64_t downloaded_bytes, uint64_t total_bytes,
                                         double speed_bps) {
    std::ostringstream oss;
    oss << label << ":";

    // Percentage and bar only when the size is known
    if (total_bytes > 0) {
        oss << " " << formatPercent(downloaded_bytes, total_bytes);
        oss << " " << formatProgressBar(downloaded_bytes, total_bytes);
    }

    oss << " " << formatBytes(downloaded_bytes);
    if (total_bytes > 0) {
        oss << "/" << formatBytes(total_bytes);
    }

    if (speed_bps > 0) {
        oss << " " << formatSpeed(speed_bps);
    }
    return oss.str();
}

std::string ProgressRenderer::formatProgressBar(uint64_t downloaded_bytes, uint64_t total_bytes, int width) {
    if (total_bytes == 0) {
        return "";
    }

    double progress = std::min(1.0, static_cast<double>(downloaded_bytes) / static_cast<double>(total_bytes));
    int filled = static_cast<int>(progress * width);

    std::ostringstream oss;
    oss << "[";
    for (int i = 0; i < width; ++i) {
        if (i < filled) {
            oss << "=";
        } else if (i == filled) {
            oss << ">";
        } else {
            oss << " ";
        }
    }
    oss << "]";
    return oss.str();
}

std::string ProgressRenderer::formatPercent(uint64_t downloaded_bytes, uint64_t total_bytes) {
    if (total_bytes == 0) {
        return "";
    }
    double percent = static_cast<double>(downloaded_bytes) * 100.0 / static_cast<double>(total_bytes);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << percent << "%";
    return oss.str();
}

std::string ProgressRenderer::formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << static_cast<uint64_t>(size) << " " << units[unit_index];
    } else {
        oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    }

    return oss.str();
}

std::string ProgressRenderer::formatSpeed(double bps) {
    const char* units[] = {"B/s", "KB/s", "MB/s", "GB/s"};
    int unit_index = 0;
    double speed = bps;

    while (speed >= 1024.0 && unit_index < 3) {
        speed /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << speed << " " << units[unit_index];
    return oss.str();
}

std::string ProgressRenderer::formatDuration(double seconds) {
    std::ostringstream oss;

    if (seconds < 60) {
        oss << static_cast<int>(std::ceil(seconds)) << "s";
    } else if (seconds < 3600) {
        int minutes = static_cast<int>(seconds / 60);
        int secs = static_cast<int>(seconds) % 60;
        oss << minutes << "m " << secs << "s";
    } else {
        int hours = static_cast<int>(seconds / 3600);
        int minutes = (static_cast<int>(seconds) % 3600) / 60;
        oss << hours << "h " << minutes << "m";
    }

    return oss.str();
}

std::string ProgressRenderer::formatSaved(const std::string& saved_path, uint64_t bytes, double seconds) {
    std::ostringstream oss;
    oss << "Saved: " << saved_path << " (" << (bytes / 1024 / 1024) << " MB in "
        << static_cast<int64_t>(std::max(0.0, seconds)) << "s)";
    return oss.str();
}

void ProgressRenderer::clearAndPrint(const std::string& content) {
    // Carriage return, then pad over whatever the previous line left behind
    out_ << "\r" << content;
    if (content.length() < last_length_) {
        out_ << std::string(last_length_ - content.length(), ' ');
        out_ << "\r" << content;
    }
    last_length_ = content.length();
    out_.flush();
}

}  // namespace cli
}  // namespace airdl
