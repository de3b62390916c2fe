#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chanview {

// One guide entry. start/end are unix seconds; the interval is [start, end).
struct EpgProgram {
    std::string id;
    std::string channel_id;
    std::string title;
    std::string description;
    int64_t start = 0;
    int64_t end = 0;
    bool has_archive = false;

    bool is_airing(int64_t now) const { return start <= now && now < end; }

    // Fraction of the slot elapsed at `now`, clamped to [0, 1].
    // 0 for a degenerate slot (end <= start).
    float progress(int64_t now) const;

    // "HH:MM" in UTC, empty when the timestamp is unset.
    std::string start_time_hhmm() const;
    std::string end_time_hhmm() const;
};

// Point-in-time queries over one channel's cached guide.
//
// The list is kept in the order given. Guide data is expected to be sorted by
// start and non-overlapping; on overlapping input current_program() returns
// the first airing entry in list order. next_program() scans every entry, so
// unsorted input still yields the nearest upcoming slot.
class EpgTimeline {
public:
    explicit EpgTimeline(std::vector<EpgProgram> programs);

    std::optional<EpgProgram> current_program(int64_t now) const;
    std::optional<EpgProgram> next_program(int64_t now) const;

    // progress() of the current program, 0 when nothing is airing.
    float current_progress(int64_t now) const;

    // Entries starting after `now`, nearest first, at most `limit`.
    std::vector<EpgProgram> upcoming(int64_t now, size_t limit) const;

    bool is_sorted() const;
    bool empty() const { return programs_.empty(); }
    size_t size() const { return programs_.size(); }
    const std::vector<EpgProgram>& programs() const { return programs_; }

private:
    std::vector<EpgProgram> programs_;
};

} // namespace chanview
