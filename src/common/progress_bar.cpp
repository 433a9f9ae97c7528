#include "disk_analyzer/common/progress_bar.hpp"
#include "disk_analyzer/common/constants.hpp"
#include <algorithm>
#include <sstream>

namespace disk_analyzer {
namespace common {

ProgressBarRenderer::ProgressBarRenderer(const std::string& label, std::ostream& out, bool use_colors,
                                         std::chrono::milliseconds refresh_interval)
    : label_(label),
      out_(out),
      use_colors_(use_colors),
      refresh_interval_(refresh_interval) {}

void ProgressBarRenderer::update(size_t current, size_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (completed_ || total == 0) {
        return;
    }
    
    // Completions from parallel workers can arrive out of order.
    if (drawn_ && current <= last_current_) {
        return;
    }
    
    auto now = std::chrono::steady_clock::now();
    if (drawn_ && current < total && now - last_draw_ < refresh_interval_) {
        return;
    }
    
    out_ << "\r" << renderLine(current, total) << std::flush;
    drawn_ = true;
    last_current_ = current;
    last_draw_ = now;
}

void ProgressBarRenderer::complete() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (completed_) {
        return;
    }
    completed_ = true;
    if (drawn_) {
        out_ << "\r\033[K" << std::flush;
    }
}

std::string ProgressBarRenderer::renderLine(size_t current, size_t total) const {
    const int bar_width = constants::limits::PROGRESS_BAR_WIDTH;
    double progress = total > 0 ? std::min(1.0, static_cast<double>(current) / total) : 0.0;
    int percent = static_cast<int>(progress * 100);
    int filled = static_cast<int>(bar_width * progress);
    
    std::ostringstream oss;
    if (use_colors_) {
        oss << "\033[36m";
    }
    
    oss << label_ << ": [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) {
            oss << "=";
        } else if (i == filled) {
            oss << ">";
        } else {
            oss << " ";
        }
    }
    oss << "] " << percent << "%";
    
    if (use_colors_) {
        oss << "\033[0m";
    }
    
    oss << " (" << current << "/" << total << ")";
    return oss.str();
}

}}
