#include "epg.hpp"
#include "util.hpp"

#include <algorithm>

namespace chanview {

float EpgProgram::progress(int64_t now) const {
    if (end <= start) return 0.0f;
    float elapsed  = static_cast<float>(now - start);
    float duration = static_cast<float>(end - start);
    return std::clamp(elapsed / duration, 0.0f, 1.0f);
}

std::string EpgProgram::start_time_hhmm() const {
    return start == 0 ? std::string() : format_utc_hhmm(start);
}

std::string EpgProgram::end_time_hhmm() const {
    return end == 0 ? std::string() : format_utc_hhmm(end);
}

EpgTimeline::EpgTimeline(std::vector<EpgProgram> programs)
    : programs_(std::move(programs)) {}

std::optional<EpgProgram> EpgTimeline::current_program(int64_t now) const {
    for (const auto& p : programs_) {
        if (p.is_airing(now)) return p;
    }
    return std::nullopt;
}

std::optional<EpgProgram> EpgTimeline::next_program(int64_t now) const {
    const EpgProgram* best = nullptr;
    for (const auto& p : programs_) {
        if (p.start <= now) continue;
        // Strict < keeps the earlier list entry on equal starts
        if (!best || p.start < best->start) best = &p;
    }
    if (!best) return std::nullopt;
    return *best;
}

float EpgTimeline::current_progress(int64_t now) const {
    auto current = current_program(now);
    return current ? current->progress(now) : 0.0f;
}

std::vector<EpgProgram> EpgTimeline::upcoming(int64_t now, size_t limit) const {
    std::vector<EpgProgram> out;
    for (const auto& p : programs_) {
        if (p.start > now) out.push_back(p);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const EpgProgram& a, const EpgProgram& b) { return a.start < b.start; });
    if (out.size() > limit) out.resize(limit);
    return out;
}

bool EpgTimeline::is_sorted() const {
    return std::is_sorted(programs_.begin(), programs_.end(),
                          [](const EpgProgram& a, const EpgProgram& b) { return a.start < b.start; });
}

} // namespace chanview
