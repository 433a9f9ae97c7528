#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>

namespace disk_analyzer {
namespace common {

// Single-line "label: [=====>    ] 42% (21/50)" indicator redrawn in place.
// update() may be called from several threads; redraws are throttled.
class ProgressBarRenderer {
public:
    ProgressBarRenderer(const std::string& label, std::ostream& out, bool use_colors,
                        std::chrono::milliseconds refresh_interval);
    
    void update(size_t current, size_t total);
    void complete();
    
    std::string renderLine(size_t current, size_t total) const;
    bool isComplete() const { return completed_; }

private:
    std::string label_;
    std::ostream& out_;
    bool use_colors_;
    std::chrono::milliseconds refresh_interval_;
    
    std::mutex mutex_;
    bool completed_ = false;
    bool drawn_ = false;
    size_t last_current_ = 0;
    std::chrono::steady_clock::time_point last_draw_;
};

}}
