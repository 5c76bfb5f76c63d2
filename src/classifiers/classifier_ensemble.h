#ifndef FACEWATCH_CLASSIFIER_ENSEMBLE_H
#define FACEWATCH_CLASSIFIER_ENSEMBLE_H

#include "classifier_model.h"
#include <string>
#include <vector>

namespace facewatch {

// Ordered classifiers sharing one label space. Immutable once built;
// reloads build a new ensemble and replace it wholesale.
class ClassifierEnsemble {
public:
    ClassifierEnsemble() = default;
    ClassifierEnsemble(std::vector<ClassifierModel> models, ClassLabelSpace labels);

    const std::vector<ClassifierModel>& models() const { return models_; }
    const ClassLabelSpace& labels() const { return labels_; }

    // No classifiers: detection-only operation
    bool empty() const { return models_.empty(); }
    size_t size() const { return models_.size(); }

private:
    std::vector<ClassifierModel> models_;
    ClassLabelSpace labels_;
};

enum class TextEncoding {
    UTF8,
    LATIN1   // legacy artifacts; class names are transcoded to UTF-8
};

// Parse "utf-8"/"utf8"/"latin1"/"latin-1" (case-insensitive), UTF8 otherwise
TextEncoding parseTextEncoding(const std::string& name);

struct EnsembleLoadOptions {
    TextEncoding encoding = TextEncoding::UTF8;
};

class EnsembleLoader {
public:
    // Load every classifier artifact in directory (*.yml, *.yaml, *.xml, *.json,
    // optionally gzipped), in filename order. A missing or empty directory
    // yields an empty ensemble.
    // Throws ArtifactError for unreadable artifacts and ConsistencyError when
    // artifacts disagree on class names or class statistics.
    static ClassifierEnsemble load(const std::string& directory, const EnsembleLoadOptions& options = {});

    // Sorted artifact paths in directory
    static std::vector<std::string> findArtifacts(const std::string& directory);

    // Byte-wise ISO-8859-1 to UTF-8
    static std::string latin1ToUtf8(const std::string& text);
};

} // namespace facewatch

#endif // FACEWATCH_CLASSIFIER_ENSEMBLE_H
