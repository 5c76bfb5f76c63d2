#include "presence_monitor.h"
#include <algorithm>

namespace facewatch {

TrackingMode parseTrackingMode(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "per_identity" ? TrackingMode::PER_IDENTITY : TrackingMode::ANY_FACE;
}

PresenceMonitor::PresenceMonitor(DebounceConfig config, TrackingMode mode)
    : config_(config), mode_(mode), any_face_(config) {}

void PresenceMonitor::observe(const FrameResult& result, const cv::Mat& frame,
                              TemporalDebouncer::Clock::time_point now) {
    if (mode_ == TrackingMode::ANY_FACE) {
        any_face_.observe(result.bestDetected(), frame, now);
        return;
    }

    // Best verdict per label this frame
    std::map<std::string, const FaceVerdict*> best;
    for (const auto& verdict : result.verdicts) {
        if (!verdict.detected || !verdict.label) continue;
        auto& slot = best[*verdict.label];
        if (!slot || verdict.confidence > slot->confidence) {
            slot = &verdict;
        }
    }

    for (const auto& [label, verdict] : best) {
        if (identities_.find(label) == identities_.end()) {
            identities_.emplace(label, TemporalDebouncer(config_));
        }
    }

    for (auto& [label, debouncer] : identities_) {
        auto it = best.find(label);
        debouncer.observe(it != best.end() ? it->second : nullptr, frame, now);
    }
}

PendingNotification PresenceMonitor::makeNotification(const TemporalDebouncer& debouncer,
                                                      const std::string& fallback) const {
    const Sighting& sighting = debouncer.bestSighting();
    PendingNotification notification;
    notification.labels = debouncer.labelsSeen();
    for (const auto& label : notification.labels) {
        if (!notification.name.empty()) notification.name += ", ";
        notification.name += label;
    }
    if (notification.name.empty()) {
        notification.name = fallback;
    }
    notification.confidence = sighting.confidence;
    notification.snapshot = sighting.snapshot;
    return notification;
}

std::vector<PendingNotification> PresenceMonitor::collectNotifications() {
    std::vector<PendingNotification> notifications;

    if (mode_ == TrackingMode::ANY_FACE) {
        if (any_face_.consumePendingNotification()) {
            notifications.push_back(makeNotification(any_face_, "Unknown person"));
        }
        return notifications;
    }

    for (auto& [label, debouncer] : identities_) {
        if (debouncer.consumePendingNotification()) {
            notifications.push_back(makeNotification(debouncer, label));
        }
    }
    return notifications;
}

const TemporalDebouncer* PresenceMonitor::debouncer(const std::string& label) const {
    if (mode_ == TrackingMode::ANY_FACE) {
        return &any_face_;
    }
    auto it = identities_.find(label);
    return it != identities_.end() ? &it->second : nullptr;
}

} // namespace facewatch
