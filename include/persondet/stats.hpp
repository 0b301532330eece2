#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace persondet {

// Fixed-capacity ring buffer of durations with a running sum.
class RollingWindow {
public:
    explicit RollingWindow(std::size_t capacity);

    void push(double value);

    std::size_t size() const noexcept { return size_; }
    std::size_t capacity() const noexcept { return values_.size(); }
    bool empty() const noexcept { return size_ == 0; }

    double sum() const noexcept { return sum_; }
    double mean() const noexcept;

private:
    std::vector<double> values_;
    std::size_t head_{0};
    std::size_t size_{0};
    double sum_{0.0};
};

struct ProcessingSummary {
    int total_frames{0};
    double total_time{0.0};
    double avg_fps{0.0};
    double avg_persons{0.0};
    int max_persons{0};
    int min_persons{0};
    std::string video_resolution;
    std::string output_path;
};

class ProcessingStats {
public:
    static constexpr std::size_t kFpsWindow = 30;

    ProcessingStats();

    void recordPersons(std::size_t count);
    void recordDuration(double seconds);
    void nextFrame() { ++frame_count_; }

    int frameCount() const noexcept { return frame_count_; }
    const std::vector<int>& personCounts() const noexcept { return person_counts_; }
    bool hasTiming() const noexcept { return !durations_.empty(); }

    // 1 / mean of the last kFpsWindow durations, 0 without timing data.
    double rollingFps() const;

    ProcessingSummary finalize(double total_time,
                               const std::string& resolution,
                               const std::string& output_path) const;

private:
    int frame_count_{0};
    std::vector<int> person_counts_;
    RollingWindow durations_;
};

}  // namespace persondet
