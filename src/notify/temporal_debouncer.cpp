#include "temporal_debouncer.h"
#include "../logger.h"
#include <algorithm>

namespace facewatch {

TemporalDebouncer::TemporalDebouncer(DebounceConfig config) : config_(config) {}

void TemporalDebouncer::observe(const FaceVerdict* verdict, const cv::Mat& frame, Clock::time_point now) {
    const bool present = verdict && verdict->detected;
    samples_.push_back({now, present});

    bool pruned = false;
    while (samples_.size() > 1 && now - samples_.front().timestamp > config_.notify_period) {
        samples_.pop_front();
        pruned = true;
    }

    // The window's first prune only arms recomputation; the probability
    // starts following the window from the next prune on.
    if (pruned) {
        if (pruned_before_) {
            recompute(now);
        }
        pruned_before_ = true;
    }

    if (present) {
        recordSighting(*verdict, frame);
    }
}

void TemporalDebouncer::recompute(Clock::time_point now) {
    size_t present = 0;
    for (const auto& sample : samples_) {
        if (sample.present) present++;
    }
    current_probability_ = static_cast<double>(present) / samples_.size();

    if (state_ == State::NOTIFIED && notified_at_ && now - *notified_at_ > config_.stay_notified) {
        state_ = State::IDLE;
        notified_at_.reset();
    }

    if (state_ == State::IDLE && current_probability_ > config_.notify_probability) {
        state_ = State::NOTIFIED;
        notified_at_ = now;
        pending_events_ = 1;
        Logger::getInstance().debug("Presence " + std::to_string(current_probability_) + " above " +
                                    std::to_string(config_.notify_probability) + ", notification queued");
    }

    if (current_probability_ == 0.0 && !episode_ended_) {
        resetEpisode();
    }
}

void TemporalDebouncer::recordSighting(const FaceVerdict& verdict, const cv::Mat& frame) {
    episode_ended_ = false;

    if (verdict.label) {
        auto it = std::lower_bound(labels_seen_.begin(), labels_seen_.end(), *verdict.label);
        if (it == labels_seen_.end() || *it != *verdict.label) {
            labels_seen_.insert(it, *verdict.label);
        }
    }

    if (verdict.confidence > best_.confidence && !frame.empty()) {
        cv::Rect box = verdict.bounding_box & cv::Rect(0, 0, frame.cols, frame.rows);
        if (box.width > 0 && box.height > 0) {
            best_.confidence = verdict.confidence;
            best_.label = verdict.label;
            best_.snapshot = frame(box).clone();
        }
    }
}

void TemporalDebouncer::resetEpisode() {
    episode_ended_ = true;
    best_ = Sighting();
    labels_seen_.clear();
}

bool TemporalDebouncer::consumePendingNotification() {
    if (pending_events_ == 0) {
        return false;
    }
    pending_events_ = 0;
    return true;
}

} // namespace facewatch
