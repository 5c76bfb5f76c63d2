#ifndef FACEWATCH_EMBEDDER_H
#define FACEWATCH_EMBEDDER_H

#include "../embedding_config.h"
#include <opencv2/core.hpp>
#include <ncnn/net.h>
#include <optional>
#include <string>

namespace facewatch {

class Embedder {
public:
    virtual ~Embedder() = default;

    // Embedding of one BGR face crop, nullopt when inference fails
    virtual std::optional<Embedding> embed(const cv::Mat& face) = 0;
};

// FaceNet-style network: 160x160 RGB crop in "in0", embedding in "out0".
// Output is L2-normalized.
class NcnnEmbedder : public Embedder {
public:
    bool loadModel(const std::string& model_base_path);
    bool isLoaded() const { return loaded_; }

    std::optional<Embedding> embed(const cv::Mat& face) override;

private:
    ncnn::Net net_;
    bool loaded_ = false;
};

} // namespace facewatch

#endif // FACEWATCH_EMBEDDER_H
