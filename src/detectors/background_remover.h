#ifndef FACEWATCH_BACKGROUND_REMOVER_H
#define FACEWATCH_BACKGROUND_REMOVER_H

#include <opencv2/core.hpp>
#include <ncnn/net.h>
#include <string>

namespace facewatch {

class BackgroundRemover {
public:
    virtual ~BackgroundRemover() = default;

    // Foreground mask for frame: CV_32F, frame size, values 0..1
    virtual cv::Mat mask(const cv::Mat& frame) = 0;

    // Frame with background pixels scaled down by the mask
    cv::Mat apply(const cv::Mat& frame);
};

// 160x160 person segmentation network: RGB scaled to 0..1 in "in0",
// single-channel foreground probability in "out0".
class NcnnBackgroundRemover : public BackgroundRemover {
public:
    bool loadModel(const std::string& model_base_path);
    bool isLoaded() const { return loaded_; }

    cv::Mat mask(const cv::Mat& frame) override;

private:
    static constexpr int INPUT_SIZE = 160;

    ncnn::Net net_;
    bool loaded_ = false;
};

} // namespace facewatch

#endif // FACEWATCH_BACKGROUND_REMOVER_H
