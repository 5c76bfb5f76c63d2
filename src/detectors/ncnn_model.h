#ifndef FACEWATCH_NCNN_MODEL_H
#define FACEWATCH_NCNN_MODEL_H

#include <ncnn/net.h>
#include <string>

namespace facewatch {

// Load <base_path>.param and <base_path>.bin into net with CPU options.
// what names the network in log messages.
bool loadNcnnModel(ncnn::Net& net, const std::string& base_path, const std::string& what);

} // namespace facewatch

#endif // FACEWATCH_NCNN_MODEL_H
