#include "jpeg_encoder.h"
#include "../logger.h"
#include <fstream>

namespace facewatch {

JpegEncoder::JpegEncoder(int quality) : quality_(quality) {
    handle_ = tjInitCompress();
    if (!handle_) {
        Logger::getInstance().error("Failed to initialize TurboJPEG compressor: " + std::string(tjGetErrorStr()));
    }
}

JpegEncoder::~JpegEncoder() {
    if (handle_) {
        tjDestroy(handle_);
        handle_ = nullptr;
    }
}

bool JpegEncoder::encode(const cv::Mat& image, std::vector<unsigned char>& jpeg) {
    if (!handle_ || image.empty() || image.depth() != CV_8U) {
        return false;
    }

    int pixel_format;
    int subsamp;
    if (image.channels() == 3) {
        pixel_format = TJPF_BGR;
        subsamp = TJSAMP_420;
    } else if (image.channels() == 1) {
        pixel_format = TJPF_GRAY;
        subsamp = TJSAMP_GRAY;
    } else {
        return false;
    }

    unsigned char* buffer = nullptr;
    unsigned long size = 0;
    if (tjCompress2(handle_, image.data, image.cols, static_cast<int>(image.step), image.rows,
                    pixel_format, &buffer, &size, subsamp, quality_, TJFLAG_FASTDCT) < 0) {
        Logger::getInstance().debug("tjCompress2 failed: " + std::string(tjGetErrorStr()));
        if (buffer) tjFree(buffer);
        return false;
    }

    jpeg.assign(buffer, buffer + size);
    tjFree(buffer);
    return true;
}

bool JpegEncoder::write(const cv::Mat& image, const std::string& path) {
    std::vector<unsigned char> jpeg;
    if (!encode(image, jpeg)) {
        return false;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        Logger::getInstance().error("Cannot write snapshot: " + path);
        return false;
    }
    file.write(reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
    return file.good();
}

} // namespace facewatch
