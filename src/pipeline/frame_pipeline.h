#ifndef FACEWATCH_FRAME_PIPELINE_H
#define FACEWATCH_FRAME_PIPELINE_H

#include "../classifiers/ensemble_store.h"
#include "../detectors/background_remover.h"
#include "../detectors/face_detector.h"
#include "../embedding/embedder.h"
#include "../recognition/face_verdict.h"
#include "../recognition/score_fusion.h"
#include <opencv2/core.hpp>
#include <vector>

namespace facewatch {

struct PipelineOptions {
    float detection_threshold = 0.5f;
    bool debug = false;
    double face_margin = 0.0;   // crop enlargement per side, fraction of box size
};

struct FrameResult {
    std::vector<FaceVerdict> verdicts;

    bool anyDetected() const;

    // Highest-confidence detected verdict, nullptr if none
    const FaceVerdict* bestDetected() const;
};

// Runs detection, embedding and score fusion for one frame at a time.
// Collaborators are borrowed; embedder and background remover are optional.
class FramePipeline {
public:
    FramePipeline(FaceDetector& detector, Embedder* embedder, EnsembleStore& store,
                  BackgroundRemover* background_remover = nullptr, PipelineOptions options = {});

    FrameResult process(const cv::Mat& frame);

    void setDebug(bool debug);
    bool debug() const { return options_.debug; }

    const PipelineOptions& options() const { return options_; }

private:
    cv::Rect expandBox(const cv::Rect& box, const cv::Size& frame_size) const;

    FaceDetector& detector_;
    Embedder* embedder_;
    EnsembleStore& store_;
    BackgroundRemover* background_remover_;
    PipelineOptions options_;
    ScoreFusionEngine fusion_;
};

} // namespace facewatch

#endif // FACEWATCH_FRAME_PIPELINE_H
