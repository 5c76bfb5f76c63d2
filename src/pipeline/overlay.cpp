#include "overlay.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <sstream>

namespace facewatch {

namespace {

constexpr int FONT = cv::FONT_HERSHEY_SIMPLEX;
constexpr int PADDING_W = 5;
constexpr int PADDING_H = 5;

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

void drawOverlays(cv::Mat& frame, const std::vector<FaceVerdict>& verdicts,
                  std::optional<double> fps, bool align_to_right) {
    if (frame.empty()) {
        return;
    }

    for (const auto& verdict : verdicts) {
        cv::rectangle(frame, verdict.bounding_box, verdict.hint.color, verdict.hint.thick ? 2 : 1);
    }

    // Scale text with the frame
    const double frame_avg = (frame.cols + frame.rows) / 2.0;
    const double font_scale = frame_avg / 1300.0;
    const int thickness = frame_avg > 1000 ? 2 : 1;

    if (fps && *fps != 0) {
        std::string fps_text = std::to_string(static_cast<int>(*fps)) + " fps";
        int baseline = 0;
        cv::Size size = cv::getTextSize(fps_text, FONT, font_scale, thickness, &baseline);
        cv::putText(frame, fps_text, cv::Point(PADDING_W, PADDING_H + size.height),
                    FONT, font_scale, cv::Scalar(0, 255, 0), thickness, cv::LINE_8);
    }

    for (const auto& verdict : verdicts) {
        if (!verdict.overlay_text || verdict.overlay_text->empty()) {
            continue;
        }

        std::vector<std::string> lines = splitLines(*verdict.overlay_text);
        if (lines.empty()) continue;

        int text_w = 0;
        int text_h = 0;
        std::vector<int> widths;
        for (const auto& line : lines) {
            int baseline = 0;
            cv::Size size = cv::getTextSize(line, FONT, font_scale, thickness, &baseline);
            text_w = std::max(text_w, size.width);
            text_h = std::max(text_h, size.height);
            widths.push_back(size.width);
        }
        const int line_h = static_cast<int>(text_h * 1.6);

        const cv::Rect& box = verdict.bounding_box;
        const int box_left = box.x;
        const int box_right = box.x + box.width;
        const int box_bottom = box.y + box.height;

        const bool to_right = box_left + text_w > frame.cols - PADDING_W;

        int top = box.y - static_cast<int>((lines.size() - 0.5) * line_h);
        if (top < line_h + PADDING_H) {
            top = std::min(box_bottom + static_cast<int>(line_h * 1.2),
                           frame.rows - line_h * static_cast<int>(lines.size()) + PADDING_H);
        }

        for (size_t i = 0; i < lines.size(); i++) {
            int left;
            if (align_to_right) {
                left = to_right ? box_right - widths[i] - PADDING_W : box_left + PADDING_W;
            } else {
                left = box_left + widths[i] > frame.cols - PADDING_W
                    ? frame.cols - widths[i] - PADDING_W
                    : box_left + PADDING_W;
            }

            cv::putText(frame, lines[i], cv::Point(left, top + static_cast<int>(i) * line_h),
                        FONT, font_scale, verdict.hint.color, thickness, cv::LINE_AA);
        }
    }
}

} // namespace facewatch
