#include "persondet/stats.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace persondet {

RollingWindow::RollingWindow(std::size_t capacity) : values_(capacity, 0.0)
{
    if (capacity == 0) {
        throw std::invalid_argument("RollingWindow capacity must be positive");
    }
}

void RollingWindow::push(double value)
{
    if (size_ == values_.size()) {
        sum_ -= values_[head_];
    } else {
        ++size_;
    }
    values_[head_] = value;
    sum_ += value;
    head_ = (head_ + 1) % values_.size();
}

double RollingWindow::mean() const noexcept
{
    if (size_ == 0) {
        return 0.0;
    }
    return sum_ / static_cast<double>(size_);
}

ProcessingStats::ProcessingStats() : durations_(kFpsWindow) {}

void ProcessingStats::recordPersons(std::size_t count)
{
    person_counts_.push_back(static_cast<int>(count));
}

void ProcessingStats::recordDuration(double seconds)
{
    durations_.push(seconds);
}

double ProcessingStats::rollingFps() const
{
    double mean = durations_.mean();
    if (mean <= 0.0) {
        return 0.0;
    }
    return 1.0 / mean;
}

ProcessingSummary ProcessingStats::finalize(double total_time,
                                            const std::string& resolution,
                                            const std::string& output_path) const
{
    ProcessingSummary summary;
    summary.total_frames = frame_count_;
    summary.total_time = total_time;
    summary.avg_fps = total_time > 0.0 ? frame_count_ / total_time : 0.0;

    if (!person_counts_.empty()) {
        double total = std::accumulate(person_counts_.begin(), person_counts_.end(), 0.0);
        summary.avg_persons = total / static_cast<double>(person_counts_.size());
        auto [lo, hi] = std::minmax_element(person_counts_.begin(), person_counts_.end());
        summary.min_persons = *lo;
        summary.max_persons = *hi;
    }

    summary.video_resolution = resolution;
    summary.output_path = output_path;
    return summary;
}

}  // namespace persondet
