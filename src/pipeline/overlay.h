#ifndef FACEWATCH_OVERLAY_H
#define FACEWATCH_OVERLAY_H

#include "../recognition/face_verdict.h"
#include <opencv2/core.hpp>
#include <optional>
#include <vector>

namespace facewatch {

// Draw face boxes, their labels and an optional frame-rate counter onto frame.
// Labels go above the box, or below it when there is no room. Lines that
// would leave the frame are aligned to the right box border (align_to_right)
// or to the right frame border.
void drawOverlays(cv::Mat& frame, const std::vector<FaceVerdict>& verdicts,
                  std::optional<double> fps = std::nullopt, bool align_to_right = true);

} // namespace facewatch

#endif // FACEWATCH_OVERLAY_H
