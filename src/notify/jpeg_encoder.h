#ifndef FACEWATCH_JPEG_ENCODER_H
#define FACEWATCH_JPEG_ENCODER_H

#include <opencv2/core.hpp>
#include <turbojpeg.h>
#include <string>
#include <vector>

namespace facewatch {

// TurboJPEG compressor for BGR snapshots
class JpegEncoder {
public:
    explicit JpegEncoder(int quality = 90);
    ~JpegEncoder();

    JpegEncoder(const JpegEncoder&) = delete;
    JpegEncoder& operator=(const JpegEncoder&) = delete;

    bool isReady() const { return handle_ != nullptr; }

    // Encode an 8-bit BGR or grayscale image; false on failure
    bool encode(const cv::Mat& image, std::vector<unsigned char>& jpeg);

    // Encode and write to path
    bool write(const cv::Mat& image, const std::string& path);

private:
    tjhandle handle_ = nullptr;
    int quality_;
};

} // namespace facewatch

#endif // FACEWATCH_JPEG_ENCODER_H
