#ifndef FACEWATCH_TEMPORAL_DEBOUNCER_H
#define FACEWATCH_TEMPORAL_DEBOUNCER_H

#include "../recognition/face_verdict.h"
#include <opencv2/core.hpp>
#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace facewatch {

struct DebounceConfig {
    std::chrono::milliseconds notify_period{3000};    // rolling presence window
    double notify_probability = 0.5;                  // presence ratio that triggers a notification
    std::chrono::milliseconds stay_notified{120000};  // no repeat notification before this elapses
};

// Best-confidence detection of the current episode
struct Sighting {
    float confidence = 0.0f;
    std::optional<std::string> label;
    cv::Mat snapshot;   // crop of the face box, may be empty
};

// Turns a per-frame stream of verdicts into discrete notification events.
// One instance per monitored stream (or tracked identity); not thread-safe.
class TemporalDebouncer {
public:
    using Clock = std::chrono::steady_clock;

    enum class State {
        IDLE,
        NOTIFIED
    };

    explicit TemporalDebouncer(DebounceConfig config = {});

    // Feed one frame. verdict is the detected face for this stream, or
    // nullptr when none was seen; frame is the source of snapshot crops.
    void observe(const FaceVerdict* verdict, const cv::Mat& frame, Clock::time_point now);

    // True exactly once per IDLE -> NOTIFIED edge
    bool consumePendingNotification();
    bool hasPendingNotification() const { return pending_events_ > 0; }

    State state() const { return state_; }
    double currentProbability() const { return current_probability_; }
    bool episodeEnded() const { return episode_ended_; }
    const Sighting& bestSighting() const { return best_; }
    const std::vector<std::string>& labelsSeen() const { return labels_seen_; }
    size_t sampleCount() const { return samples_.size(); }

    const DebounceConfig& config() const { return config_; }

private:
    struct Sample {
        Clock::time_point timestamp;
        bool present;
    };

    void recompute(Clock::time_point now);
    void recordSighting(const FaceVerdict& verdict, const cv::Mat& frame);
    void resetEpisode();

    DebounceConfig config_;
    std::deque<Sample> samples_;
    bool pruned_before_ = false;

    double current_probability_ = 0.0;
    State state_ = State::IDLE;
    std::optional<Clock::time_point> notified_at_;
    int pending_events_ = 0;   // queue depth is 1

    Sighting best_;
    std::vector<std::string> labels_seen_;
    bool episode_ended_ = false;
};

} // namespace facewatch

#endif // FACEWATCH_TEMPORAL_DEBOUNCER_H
