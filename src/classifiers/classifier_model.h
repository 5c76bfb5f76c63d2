#ifndef FACEWATCH_CLASSIFIER_MODEL_H
#define FACEWATCH_CLASSIFIER_MODEL_H

#include "svm_probability.h"
#include "../embedding_config.h"
#include <opencv2/core.hpp>
#include <opencv2/ml.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace facewatch {

enum class ClassifierKind {
    KNN,          // cv::ml::KNearest reference set
    SVM,          // cv::ml::SVM decision surface
    UNSUPPORTED   // anything else; excluded from fusion
};

std::string classifierKindName(ClassifierKind kind);

// Per-class training statistics stored next to every classifier
struct ClassStats {
    int embeddings = 0;                        // training embeddings for the class (kNN scoring)
    std::map<std::string, double> attributes;  // any further numeric fields, compared verbatim

    bool operator==(const ClassStats& other) const {
        return embeddings == other.embeddings && attributes == other.attributes;
    }
    bool operator!=(const ClassStats& other) const { return !(*this == other); }
};

// Label space shared by every classifier of an ensemble
struct ClassLabelSpace {
    std::vector<std::string> class_names;
    std::vector<ClassStats> class_stats;  // aligned with class_names

    size_t size() const { return class_names.size(); }
    bool empty() const { return class_names.empty(); }
};

// One neighbor of a kNN query, nearest first
struct Neighbor {
    int class_index;
    float distance;  // Euclidean
};

// A loaded classifier. The kind tag is fixed at load time and fusion code
// dispatches on it; the handle matching the kind is the only one set.
class ClassifierModel {
public:
    static ClassifierModel fromKNearest(cv::Ptr<cv::ml::KNearest> knn, int reference_count,
                                        const std::string& source_path);
    static ClassifierModel fromSvm(SvmDecisionSurface surface, const std::string& source_path);
    static ClassifierModel unsupported(const std::string& type_name, size_t ensemble_index,
                                       const std::string& source_path);

    ClassifierKind kind() const { return kind_; }
    size_t embeddingSize() const { return embedding_size_; }
    const std::string& displayName() const { return display_name_; }
    const std::string& sourcePath() const { return source_path_; }

    // Human readable description for logs ("kNN (neighbors 5) classifier")
    std::string describe() const;

    // Probability distribution over the label space. The embedding width must
    // already match embeddingSize(). Empty for UNSUPPORTED models.
    std::vector<double> predictProba(const Embedding& embedding, size_t label_count) const;

    // kNN only: the k nearest reference embeddings, increasing distance.
    // k is clamped to [1, referenceCount()].
    std::vector<Neighbor> nearestNeighbors(const Embedding& embedding, int k) const;

    int referenceCount() const { return reference_count_; }
    int defaultK() const;

private:
    ClassifierModel() = default;

    ClassifierKind kind_ = ClassifierKind::UNSUPPORTED;
    size_t embedding_size_ = DEFAULT_EMBEDDING_SIZE;
    std::string display_name_;
    std::string type_name_;
    std::string source_path_;
    int reference_count_ = 0;

    cv::Ptr<cv::ml::KNearest> knn_;
    std::optional<SvmDecisionSurface> svm_;
};

} // namespace facewatch

#endif // FACEWATCH_CLASSIFIER_MODEL_H
