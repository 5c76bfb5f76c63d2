#include "frame_pipeline.h"
#include "../logger.h"

namespace facewatch {

bool FrameResult::anyDetected() const {
    return bestDetected() != nullptr;
}

const FaceVerdict* FrameResult::bestDetected() const {
    const FaceVerdict* best = nullptr;
    for (const auto& verdict : verdicts) {
        if (verdict.detected && (!best || verdict.confidence > best->confidence)) {
            best = &verdict;
        }
    }
    return best;
}

FramePipeline::FramePipeline(FaceDetector& detector, Embedder* embedder, EnsembleStore& store,
                             BackgroundRemover* background_remover, PipelineOptions options)
    : detector_(detector),
      embedder_(embedder),
      store_(store),
      background_remover_(background_remover),
      options_(options),
      fusion_(options.debug) {}

void FramePipeline::setDebug(bool debug) {
    options_.debug = debug;
    fusion_.setDebug(debug);
}

cv::Rect FramePipeline::expandBox(const cv::Rect& box, const cv::Size& frame_size) const {
    int dx = static_cast<int>(box.width * options_.face_margin);
    int dy = static_cast<int>(box.height * options_.face_margin);
    cv::Rect expanded(box.x - dx, box.y - dy, box.width + 2 * dx, box.height + 2 * dy);
    return expanded & cv::Rect(0, 0, frame_size.width, frame_size.height);
}

FrameResult FramePipeline::process(const cv::Mat& frame) {
    FrameResult result;
    auto& logger = Logger::getInstance();

    if (frame.empty()) {
        logger.debug("Empty frame skipped");
        return result;
    }

    // Masked copy is only used to find faces; crops come from the original
    cv::Mat detection_frame = frame;
    if (background_remover_) {
        detection_frame = background_remover_->apply(frame);
    }

    const cv::Rect frame_rect(0, 0, frame.cols, frame.rows);
    std::vector<cv::Rect> boxes = detector_.detect(detection_frame, options_.detection_threshold);

    // One snapshot for the whole frame
    std::shared_ptr<const ClassifierEnsemble> ensemble = store_.current();
    const bool recognize = embedder_ && ensemble && !ensemble->empty();

    for (const auto& raw_box : boxes) {
        cv::Rect box = raw_box & frame_rect;
        if (box.width <= 0 || box.height <= 0) {
            continue;
        }

        if (!recognize) {
            FaceVerdict verdict;
            verdict.bounding_box = box;
            verdict.hint = RenderHint::notDetected();
            result.verdicts.push_back(std::move(verdict));
            continue;
        }

        cv::Mat crop = frame(expandBox(box, frame.size()));
        std::optional<Embedding> embedding = embedder_->embed(crop);
        if (!embedding) {
            logger.debug("No embedding for face at " + std::to_string(box.x) + "," + std::to_string(box.y));
            FaceVerdict verdict;
            verdict.bounding_box = box;
            verdict.hint = RenderHint::notDetected();
            result.verdicts.push_back(std::move(verdict));
            continue;
        }

        FaceVerdict verdict = fusion_.score(*embedding, *ensemble);
        verdict.bounding_box = box;
        result.verdicts.push_back(std::move(verdict));
    }

    return result;
}

} // namespace facewatch
