#include "background_remover.h"
#include "ncnn_model.h"
#include "../logger.h"
#include <opencv2/imgproc.hpp>

namespace facewatch {

cv::Mat BackgroundRemover::apply(const cv::Mat& frame) {
    cv::Mat m = mask(frame);
    if (m.empty()) {
        return frame;
    }

    std::vector<cv::Mat> planes(frame.channels(), m);
    cv::Mat mask3;
    cv::merge(planes, mask3);

    cv::Mat as_float;
    frame.convertTo(as_float, CV_32F);
    cv::multiply(as_float, mask3, as_float);

    cv::Mat masked;
    as_float.convertTo(masked, frame.type());
    return masked;
}

bool NcnnBackgroundRemover::loadModel(const std::string& model_base_path) {
    loaded_ = loadNcnnModel(net_, model_base_path, "background removal");
    return loaded_;
}

cv::Mat NcnnBackgroundRemover::mask(const cv::Mat& frame) {
    if (!loaded_ || frame.empty() || frame.type() != CV_8UC3) {
        return cv::Mat();
    }

    ncnn::Mat in = ncnn::Mat::from_pixels_resize(frame.data, ncnn::Mat::PIXEL_BGR2RGB, frame.cols, frame.rows,
                                                 static_cast<int>(frame.step), INPUT_SIZE, INPUT_SIZE);
    const float norm_vals[3] = {1.f / 255.f, 1.f / 255.f, 1.f / 255.f};
    in.substract_mean_normalize(nullptr, norm_vals);

    ncnn::Extractor ex = net_.create_extractor();
    ex.set_light_mode(true);
    ex.input("in0", in);

    ncnn::Mat out;
    int ret = ex.extract("out0", out);
    if (ret != 0) {
        Logger::getInstance().debug("Background removal inference failed, ret=" + std::to_string(ret));
        return cv::Mat();
    }

    ncnn::Mat plane = out.channel(0);
    cv::Mat small(out.h, out.w, CV_32F, static_cast<float*>(plane.data));

    cv::Mat resized;
    cv::resize(small, resized, frame.size());
    return resized;
}

} // namespace facewatch
