#ifndef FACEWATCH_FACE_DETECTOR_H
#define FACEWATCH_FACE_DETECTOR_H

#include <opencv2/core.hpp>
#include <ncnn/net.h>
#include <string>
#include <vector>

namespace facewatch {

class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    // Face boxes in frame pixels with confidence >= threshold
    virtual std::vector<cv::Rect> detect(const cv::Mat& frame, float threshold) = 0;
};

// SSD-style detector: input blob "data" (raw BGR, no normalization),
// output "detection_out" with one row per face:
//   [label, score, x1, y1, x2, y2]   (coordinates normalized to 0..1)
class NcnnFaceDetector : public FaceDetector {
public:
    NcnnFaceDetector(int input_width = 300, int input_height = 300);

    // Loads <model_base_path>.param / .bin
    bool loadModel(const std::string& model_base_path);
    bool isLoaded() const { return loaded_; }

    std::vector<cv::Rect> detect(const cv::Mat& frame, float threshold) override;

private:
    ncnn::Net net_;
    int input_width_;
    int input_height_;
    bool loaded_ = false;
};

} // namespace facewatch

#endif // FACEWATCH_FACE_DETECTOR_H
