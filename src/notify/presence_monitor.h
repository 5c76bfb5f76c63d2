#ifndef FACEWATCH_PRESENCE_MONITOR_H
#define FACEWATCH_PRESENCE_MONITOR_H

#include "temporal_debouncer.h"
#include "../pipeline/frame_pipeline.h"
#include <map>
#include <string>
#include <vector>

namespace facewatch {

enum class TrackingMode {
    ANY_FACE,      // one window for "some known face is present"
    PER_IDENTITY   // one window per recognized label
};

// Parse "any"/"per_identity", ANY_FACE otherwise
TrackingMode parseTrackingMode(const std::string& name);

struct PendingNotification {
    std::string name;          // labels seen this episode, comma separated
    std::vector<std::string> labels;   // the same labels, sorted; empty for an unknown person
    float confidence = 0.0f;
    cv::Mat snapshot;
};

// Feeds frame results into temporal debouncers and gathers the
// notifications they raise.
class PresenceMonitor {
public:
    PresenceMonitor(DebounceConfig config, TrackingMode mode);

    void observe(const FrameResult& result, const cv::Mat& frame, TemporalDebouncer::Clock::time_point now);

    // Consume every pending notification (at most one per debouncer)
    std::vector<PendingNotification> collectNotifications();

    TrackingMode mode() const { return mode_; }

    // Debouncer for label (PER_IDENTITY) or the shared one (ANY_FACE), nullptr if unknown
    const TemporalDebouncer* debouncer(const std::string& label = "") const;

private:
    PendingNotification makeNotification(const TemporalDebouncer& debouncer, const std::string& fallback) const;

    DebounceConfig config_;
    TrackingMode mode_;
    TemporalDebouncer any_face_;
    std::map<std::string, TemporalDebouncer> identities_;
};

} // namespace facewatch

#endif // FACEWATCH_PRESENCE_MONITOR_H
