#include "commands.h"
#include "cli_common.h"
#include "../pipeline/overlay.h"
#include "../pipeline/pipeline_setup.h"
#include <opencv2/imgcodecs.hpp>

namespace facewatch {

int cmd_image(const std::vector<std::string>& args) {
    std::string input_path;
    std::string output_path;
    std::string classifiers_dir;
    bool debug = false;
    bool verbose = false;

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--debug") {
            debug = true;
        } else if (args[i] == "--verbose") {
            verbose = true;
        } else if (args[i] == "--output" && i + 1 < args.size()) {
            output_path = args[++i];
        } else if (args[i] == "--classifiers" && i + 1 < args.size()) {
            classifiers_dir = args[++i];
        } else if (input_path.empty() && args[i].rfind("--", 0) != 0) {
            input_path = args[i];
        } else {
            std::cerr << "Unknown argument: " << args[i] << std::endl;
            return 1;
        }
    }

    if (input_path.empty()) {
        std::cerr << "Error: image path required" << std::endl;
        return 1;
    }

    cli::setupConsoleLogging(verbose);
    cli::loadDefaultConfig();

    cv::Mat image = cv::imread(input_path, cv::IMREAD_COLOR);
    if (image.empty()) {
        std::cerr << "Error: Failed to load image: " << input_path << std::endl;
        return 1;
    }

    PipelineComponents components;
    if (!buildPipeline(components, debug, classifiers_dir)) {
        std::cerr << "Error: Failed to set up the recognition pipeline" << std::endl;
        return 1;
    }

    FrameResult result = components.pipeline->process(image);

    std::cout << "Image: " << input_path << " (" << image.cols << "x" << image.rows << ")" << std::endl;
    std::cout << "Faces: " << result.verdicts.size() << std::endl;
    for (size_t i = 0; i < result.verdicts.size(); i++) {
        const FaceVerdict& verdict = result.verdicts[i];
        const cv::Rect& box = verdict.bounding_box;
        std::cout << "  [" << i << "] " << box.x << "," << box.y << " " << box.width << "x" << box.height << "  ";
        if (verdict.detected) {
            std::cout << *verdict.label << " (" << std::fixed << std::setprecision(1)
                      << verdict.confidence * 100.0f << "%)" << std::endl;
        } else {
            std::cout << "not recognized" << std::endl;
        }
        for (const auto& line : verdict.debug_lines) {
            std::cout << "        " << line << std::endl;
        }
    }

    if (!output_path.empty()) {
        cv::Mat annotated = image.clone();
        drawOverlays(annotated, result.verdicts);
        if (!cv::imwrite(output_path, annotated)) {
            std::cerr << "Error: Failed to write " << output_path << std::endl;
            return 1;
        }
        std::cout << "Annotated image written to " << output_path << std::endl;
    }

    return 0;
}

} // namespace facewatch
