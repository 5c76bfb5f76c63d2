#include "face_detector.h"
#include "ncnn_model.h"
#include "../logger.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace facewatch {

NcnnFaceDetector::NcnnFaceDetector(int input_width, int input_height)
    : input_width_(input_width), input_height_(input_height) {}

bool NcnnFaceDetector::loadModel(const std::string& model_base_path) {
    loaded_ = loadNcnnModel(net_, model_base_path, "face detection");
    return loaded_;
}

std::vector<cv::Rect> NcnnFaceDetector::detect(const cv::Mat& frame, float threshold) {
    std::vector<cv::Rect> faces;
    if (!loaded_ || frame.empty()) {
        return faces;
    }

    cv::Mat bgr = frame;
    if (frame.channels() == 1) {
        cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
    } else if (frame.channels() == 4) {
        cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
    }
    if (bgr.depth() != CV_8U) {
        bgr.convertTo(bgr, CV_8U);
    }

    const int img_w = bgr.cols;
    const int img_h = bgr.rows;

    ncnn::Mat in = ncnn::Mat::from_pixels_resize(bgr.data, ncnn::Mat::PIXEL_BGR, img_w, img_h,
                                                 static_cast<int>(bgr.step), input_width_, input_height_);

    ncnn::Extractor ex = net_.create_extractor();
    ex.set_light_mode(true);
    ex.input("data", in);

    ncnn::Mat out;
    int ret = ex.extract("detection_out", out);
    if (ret != 0) {
        Logger::getInstance().debug("Face detection inference failed, ret=" + std::to_string(ret));
        return faces;
    }

    for (int i = 0; i < out.h; i++) {
        const float* values = out.row(i);
        float score = values[1];
        if (score < threshold) continue;

        int x1 = static_cast<int>(values[2] * img_w);
        int y1 = static_cast<int>(values[3] * img_h);
        int x2 = static_cast<int>(values[4] * img_w);
        int y2 = static_cast<int>(values[5] * img_h);

        cv::Rect box(x1, y1, x2 - x1, y2 - y1);
        box &= cv::Rect(0, 0, img_w, img_h);
        if (box.width > 0 && box.height > 0) {
            faces.push_back(box);
        }
    }

    return faces;
}

} // namespace facewatch
