#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <iostream>

namespace airdl {
namespace cli {

/// Single-line progress renderer for one transfer at a time
class ProgressRenderer {
public:
    /// @param out Stream the progress lines are written to
    explicit ProgressRenderer(std::ostream& out = std::cout);

    /// Begin a new transfer; resets the speed clock
    /// @param label Name shown in front of the progress line (file name or URL)
    void start(const std::string& label);

    /// Update progress
    /// @param downloaded_bytes Bytes written so far
    /// @param total_bytes Declared size (0 if unknown)
    void update(uint64_t downloaded_bytes, uint64_t total_bytes);

    /// Finish the current line with "Saved: <path> (<MB> MB in <s>s)"
    void complete(const std::string& saved_path, uint64_t bytes, double seconds);

    /// Finish the current line with a failure message
    void fail(const std::string& error_message);

    /// Build a progress line (e.g., "model.safetensors: 45.20% [=====>   ] 1.2 GB/2.6 GB 45.2 MB/s")
    static std::string formatLine(const std::string& label, uint64_t downloaded_bytes, uint64_t total_bytes,
                                  double speed_bps);

    /// Get progress bar string (e.g., "[======>   ]"); empty when total is unknown
    static std::string formatProgressBar(uint64_t downloaded_bytes, uint64_t total_bytes, int width = 20);

    /// Percentage with two decimals (e.g., "45.20%"); empty when total is unknown
    static std::string formatPercent(uint64_t downloaded_bytes, uint64_t total_bytes);

    /// Format bytes as human-readable string
    /// @param bytes Number of bytes
    /// @return Human-readable string (e.g., "6.4 GB", "128 MB")
    static std::string formatBytes(uint64_t bytes);

    /// Format speed as human-readable string
    /// @param bps Speed in bytes per second
    /// @return Human-readable string (e.g., "45.2 MB/s")
    static std::string formatSpeed(double bps);

    /// Format duration as human-readable string
    /// @param seconds Duration in seconds
    /// @return Human-readable string (e.g., "2m 30s", "45s")
    static std::string formatDuration(double seconds);

    /// "Saved: <path> (<whole MB> MB in <whole seconds>s)"
    static std::string formatSaved(const std::string& saved_path, uint64_t bytes, double seconds);

private:
    std::ostream& out_;
    std::string label_;
    std::chrono::steady_clock::time_point start_time_;
    size_t last_length_{0};
    bool active_{false};

    /// Clear current line and print new content
    void clearAndPrint(const std::string& content);
};

}  // namespace cli
}  // namespace airdl
