#include "notifier.h"
#include "../config.h"
#include "../logger.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <vector>

namespace facewatch {

namespace {

std::string personField(const std::vector<std::string>& labels, const std::string& key) {
    auto& config = Config::getInstance();
    std::string joined;
    for (const auto& label : labels) {
        auto value = config.getString("person:" + label, key);
        if (!value || value->empty()) continue;
        if (!joined.empty()) joined += ", ";
        joined += labels.size() == 1 ? *value : *value + " (" + label + ")";
    }
    return joined;
}

} // namespace

PrintNotifier::PrintNotifier(std::ostream& out, std::string snapshot_dir)
    : out_(out), snapshot_dir_(std::move(snapshot_dir)) {
    if (!snapshot_dir_.empty()) {
        encoder_ = std::make_unique<JpegEncoder>();
    }
}

std::string PrintNotifier::formatBanner(const Notification& notification) {
    std::vector<std::string> lines;
    lines.push_back(notification.name + " has been detected");
    if (!notification.position.empty()) {
        lines.push_back("Position: " + notification.position);
    }
    if (!notification.company.empty()) {
        lines.push_back("Company: " + notification.company);
    }
    if (!notification.image.empty()) {
        lines.push_back("[IMAGE]");
    }

    size_t width = 0;
    for (const auto& line : lines) {
        width = std::max(width, line.size());
    }
    const std::string ruler(width, '=');

    std::string banner = ruler + "\n";
    for (const auto& line : lines) {
        banner += line + "\n";
    }
    banner += ruler;
    return banner;
}

std::string PrintNotifier::snapshotPath(const std::string& name) const {
    std::string safe = name;
    std::replace_if(safe.begin(), safe.end(), [](char c) {
        return c == '/' || c == ' ' || c == ',' || c == '\\';
    }, '_');

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &tm_buf);

    return snapshot_dir_ + "/" + stamp + "_" + safe + ".jpg";
}

void PrintNotifier::notify(const Notification& notification) {
    out_ << formatBanner(notification) << std::endl;

    last_snapshot_path_.clear();
    if (encoder_ && !notification.image.empty()) {
        std::string path = snapshotPath(notification.name);
        if (encoder_->write(notification.image, path)) {
            last_snapshot_path_ = path;
        } else {
            Logger::getInstance().warning("Snapshot for " + notification.name + " not saved");
        }
    }

    Logger::getInstance().info(notification.name + " has been detected" +
        (last_snapshot_path_.empty() ? "" : ", snapshot " + last_snapshot_path_));
}

Notification makeNotification(const std::string& name, const std::vector<std::string>& labels,
                              const cv::Mat& image) {
    Notification notification;
    notification.name = name;
    notification.position = personField(labels, "position");
    notification.company = personField(labels, "company");
    notification.image = image;
    return notification;
}

} // namespace facewatch
