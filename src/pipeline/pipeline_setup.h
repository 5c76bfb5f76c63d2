#ifndef FACEWATCH_PIPELINE_SETUP_H
#define FACEWATCH_PIPELINE_SETUP_H

#include "frame_pipeline.h"
#include "../classifiers/ensemble_store.h"
#include "../detectors/background_remover.h"
#include "../detectors/face_detector.h"
#include "../embedding/embedder.h"
#include <memory>

namespace facewatch {

// Owns the networks, the ensemble store and the pipeline built from them
struct PipelineComponents {
    std::unique_ptr<NcnnFaceDetector> detector;
    std::unique_ptr<NcnnEmbedder> embedder;                    // null in detection-only mode
    std::unique_ptr<NcnnBackgroundRemover> background_remover; // null when not configured
    std::unique_ptr<EnsembleStore> store;
    std::unique_ptr<FramePipeline> pipeline;
};

// Build the pipeline from the [detection] and [recognition] config sections.
// classifiers_dir overrides [recognition] classifiers_dir when not empty.
// Returns false (after logging why) if a configured model cannot be loaded.
bool buildPipeline(PipelineComponents& components, bool debug, const std::string& classifiers_dir = "");

} // namespace facewatch

#endif // FACEWATCH_PIPELINE_SETUP_H
