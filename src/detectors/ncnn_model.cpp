#include "ncnn_model.h"
#include "../logger.h"
#include <sys/stat.h>

namespace facewatch {

namespace {

bool fileExists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace

bool loadNcnnModel(ncnn::Net& net, const std::string& base_path, const std::string& what) {
    auto& logger = Logger::getInstance();

    const std::string param_path = base_path + ".param";
    const std::string bin_path = base_path + ".bin";

    if (!fileExists(param_path) || !fileExists(bin_path)) {
        logger.error(what + " model not found: " + base_path + ".{param,bin}");
        return false;
    }

    logger.debug("Loading " + what + " model");
    logger.debug("  param: " + param_path);
    logger.debug("  bin:   " + bin_path);

    net.opt.use_vulkan_compute = false;
    net.opt.num_threads = 4;
    net.opt.use_fp16_packed = false;
    net.opt.use_fp16_storage = false;

    int ret = net.load_param(param_path.c_str());
    if (ret != 0) {
        logger.error("Failed to load " + what + " param file, ret=" + std::to_string(ret));
        return false;
    }

    ret = net.load_model(bin_path.c_str());
    if (ret != 0) {
        logger.error("Failed to load " + what + " model file, ret=" + std::to_string(ret));
        return false;
    }

    logger.info("Loaded " + what + " model " + base_path);
    return true;
}

} // namespace facewatch
