#ifndef FACEWATCH_ERRORS_H
#define FACEWATCH_ERRORS_H

#include <stdexcept>
#include <string>

namespace facewatch {

// Classifiers in one ensemble directory disagree on the label space.
// Fatal to the load: no partial ensemble is ever returned.
class ConsistencyError : public std::runtime_error {
public:
    explicit ConsistencyError(const std::string& message)
        : std::runtime_error(message) {}
};

// A classifier artifact cannot be read or lacks its label data.
class ArtifactError : public std::runtime_error {
public:
    ArtifactError(const std::string& path, const std::string& reason)
        : std::runtime_error(path + ": " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace facewatch

#endif // FACEWATCH_ERRORS_H
