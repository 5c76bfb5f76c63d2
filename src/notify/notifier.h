#ifndef FACEWATCH_NOTIFIER_H
#define FACEWATCH_NOTIFIER_H

#include "jpeg_encoder.h"
#include <opencv2/core.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace facewatch {

struct Notification {
    std::string name;
    std::string position;   // empty when unknown
    std::string company;    // empty when unknown
    cv::Mat image;          // snapshot, may be empty
};

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const Notification& notification) = 0;
};

// Prints a framed banner:
//   ===========================
//   Jane Doe has been detected
//   Position: ...
//   Company: ...
//   [IMAGE]
//   ===========================
// and, when snapshot_dir is set, stores the snapshot there as JPEG.
class PrintNotifier : public Notifier {
public:
    explicit PrintNotifier(std::ostream& out, std::string snapshot_dir = "");

    void notify(const Notification& notification) override;

    // Banner text without the trailing newline
    static std::string formatBanner(const Notification& notification);

    const std::string& lastSnapshotPath() const { return last_snapshot_path_; }

private:
    std::string snapshotPath(const std::string& name) const;

    std::ostream& out_;
    std::string snapshot_dir_;
    std::unique_ptr<JpegEncoder> encoder_;
    std::string last_snapshot_path_;
};

// Fill position/company from the [person:<label>] config sections. With
// several labels each value is tagged with its label: "CTO (alice), CFO (bob)".
Notification makeNotification(const std::string& name, const std::vector<std::string>& labels,
                              const cv::Mat& image);

} // namespace facewatch

#endif // FACEWATCH_NOTIFIER_H
