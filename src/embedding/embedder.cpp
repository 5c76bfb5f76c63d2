#include "embedder.h"
#include "../detectors/ncnn_model.h"
#include "../logger.h"
#include <opencv2/imgproc.hpp>
#include <cmath>

namespace facewatch {

bool NcnnEmbedder::loadModel(const std::string& model_base_path) {
    loaded_ = loadNcnnModel(net_, model_base_path, "face embedding");
    return loaded_;
}

std::optional<Embedding> NcnnEmbedder::embed(const cv::Mat& face) {
    if (!loaded_ || face.empty()) {
        return std::nullopt;
    }

    cv::Mat bgr = face;
    if (face.channels() == 1) {
        cv::cvtColor(face, bgr, cv::COLOR_GRAY2BGR);
    }
    if (!bgr.isContinuous()) {
        bgr = bgr.clone();
    }

    // Model has built-in preprocessing; feed raw RGB
    ncnn::Mat in = ncnn::Mat::from_pixels_resize(bgr.data, ncnn::Mat::PIXEL_BGR2RGB, bgr.cols, bgr.rows,
                                                 EMBEDDER_INPUT_SIZE, EMBEDDER_INPUT_SIZE);

    ncnn::Extractor ex = net_.create_extractor();
    ex.set_light_mode(true);
    ex.input("in0", in);

    ncnn::Mat out;
    int ret = ex.extract("out0", out);
    if (ret != 0) {
        Logger::getInstance().debug("Embedding inference failed, ret=" + std::to_string(ret));
        return std::nullopt;
    }

    ncnn::Mat flat = out.reshape(out.w * out.h * out.c);
    Embedding embedding(flat.w);
    for (int i = 0; i < flat.w; i++) {
        embedding[i] = flat[i];
    }

    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);
    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }

    return embedding;
}

} // namespace facewatch
