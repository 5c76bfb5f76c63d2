#ifndef FACEWATCH_FACE_VERDICT_H
#define FACEWATCH_FACE_VERDICT_H

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace facewatch {

// How a face box should be drawn
struct RenderHint {
    bool thick = false;
    cv::Scalar color = cv::Scalar(0, 0, 255);  // BGR

    static RenderHint notDetected() { return {false, cv::Scalar(0, 0, 255)}; }
    static RenderHint detected() { return {true, cv::Scalar(0, 255, 0)}; }
};

// Fused decision for one detected face in one frame
struct FaceVerdict {
    cv::Rect bounding_box;              // frame pixels
    bool detected = false;
    std::optional<std::string> label;   // set only when detected
    float confidence = 0.0f;            // mean contributor probability, 0 when not detected
    std::vector<std::string> debug_lines;
    std::optional<std::string> overlay_text;
    RenderHint hint;
};

} // namespace facewatch

#endif // FACEWATCH_FACE_VERDICT_H
