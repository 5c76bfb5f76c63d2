#include "pipeline_setup.h"
#include "../config.h"
#include "../logger.h"
#include "config_paths.h"

namespace facewatch {

bool buildPipeline(PipelineComponents& components, bool debug, const std::string& classifiers_dir) {
    auto& config = Config::getInstance();
    auto& logger = Logger::getInstance();

    std::string detection_model = config.getString("detection", "model")
        .value_or(std::string(MODELS_DIR) + "/face-detection");
    int input_width = config.getInt("detection", "input_width").value_or(300);
    int input_height = config.getInt("detection", "input_height").value_or(300);

    components.detector = std::make_unique<NcnnFaceDetector>(input_width, input_height);
    if (!components.detector->loadModel(detection_model)) {
        logger.error("Face detection model is required: " + detection_model);
        return false;
    }

    std::string bg_model = config.getString("detection", "bg_remove_model").value_or("");
    if (!bg_model.empty()) {
        components.background_remover = std::make_unique<NcnnBackgroundRemover>();
        if (!components.background_remover->loadModel(bg_model)) {
            return false;
        }
    }

    std::string embedding_model = config.getString("recognition", "embedding_model")
        .value_or(std::string(MODELS_DIR) + "/facenet");
    if (!embedding_model.empty()) {
        components.embedder = std::make_unique<NcnnEmbedder>();
        if (!components.embedder->loadModel(embedding_model)) {
            return false;
        }
    } else {
        logger.info("No embedding model configured, running detection only");
    }

    std::string dir = classifiers_dir;
    if (dir.empty()) {
        dir = config.getString("recognition", "classifiers_dir").value_or(CLASSIFIERS_DIR);
    }
    EnsembleLoadOptions load_options;
    load_options.encoding = parseTextEncoding(config.getString("recognition", "classifier_encoding").value_or("utf-8"));

    components.store = std::make_unique<EnsembleStore>(dir, load_options);
    if (!components.store->reload()) {
        logger.warning("Starting without classifiers from " + dir);
    }

    PipelineOptions options;
    options.detection_threshold = static_cast<float>(config.getDouble("detection", "threshold").value_or(0.5));
    options.face_margin = config.getDouble("recognition", "face_margin").value_or(0.0);
    options.debug = debug;

    components.pipeline = std::make_unique<FramePipeline>(
        *components.detector, components.embedder.get(), *components.store,
        components.background_remover.get(), options);

    return true;
}

} // namespace facewatch
