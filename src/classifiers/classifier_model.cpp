#include "classifier_model.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace facewatch {

std::string classifierKindName(ClassifierKind kind) {
    switch (kind) {
        case ClassifierKind::KNN: return "kNN";
        case ClassifierKind::SVM: return "SVM";
        default:                  return "unsupported";
    }
}

ClassifierModel ClassifierModel::fromKNearest(cv::Ptr<cv::ml::KNearest> knn, int reference_count,
                                              const std::string& source_path) {
    ClassifierModel model;
    model.kind_ = ClassifierKind::KNN;
    model.embedding_size_ = static_cast<size_t>(knn->getVarCount());
    model.display_name_ = classifierKindName(ClassifierKind::KNN);
    model.type_name_ = "opencv_ml_knn";
    model.source_path_ = source_path;
    model.reference_count_ = reference_count;
    model.knn_ = std::move(knn);
    return model;
}

ClassifierModel ClassifierModel::fromSvm(SvmDecisionSurface surface, const std::string& source_path) {
    ClassifierModel model;
    model.kind_ = ClassifierKind::SVM;
    model.embedding_size_ = surface.varCount();
    model.display_name_ = classifierKindName(ClassifierKind::SVM);
    model.type_name_ = "opencv_ml_svm";
    model.source_path_ = source_path;
    model.svm_ = std::move(surface);
    return model;
}

ClassifierModel ClassifierModel::unsupported(const std::string& type_name, size_t ensemble_index,
                                             const std::string& source_path) {
    ClassifierModel model;
    model.kind_ = ClassifierKind::UNSUPPORTED;
    model.embedding_size_ = DEFAULT_EMBEDDING_SIZE;
    model.display_name_ = std::to_string(ensemble_index);
    model.type_name_ = type_name;
    model.source_path_ = source_path;
    return model;
}

std::string ClassifierModel::describe() const {
    std::ostringstream out;
    switch (kind_) {
        case ClassifierKind::KNN:
            out << "kNN (neighbors " << defaultK() << ", references " << reference_count_ << ")";
            break;
        case ClassifierKind::SVM:
            out << "SVM (" << svm_->kernelName() << " kernel, " << svm_->classCount() << " classes)";
            break;
        default:
            out << "unsupported (" << type_name_ << ")";
            break;
    }
    out << " classifier, embedding size " << embedding_size_;
    return out.str();
}

int ClassifierModel::defaultK() const {
    return knn_ ? knn_->getDefaultK() : 0;
}

std::vector<double> ClassifierModel::predictProba(const Embedding& embedding, size_t label_count) const {
    if (kind_ == ClassifierKind::SVM) {
        return svm_->predictProba(embedding, label_count);
    }
    if (kind_ != ClassifierKind::KNN) {
        return {};
    }

    std::vector<Neighbor> neighbors = nearestNeighbors(embedding, std::max(1, defaultK()));
    std::vector<double> proba(label_count, 0.0);
    if (neighbors.empty()) {
        return proba;
    }

    const double weight = 1.0 / static_cast<double>(neighbors.size());
    for (const auto& n : neighbors) {
        if (n.class_index >= 0 && static_cast<size_t>(n.class_index) < label_count) {
            proba[n.class_index] += weight;
        }
    }
    return proba;
}

std::vector<Neighbor> ClassifierModel::nearestNeighbors(const Embedding& embedding, int k) const {
    if (kind_ != ClassifierKind::KNN || reference_count_ <= 0) {
        return {};
    }
    k = std::min(std::max(k, 1), reference_count_);

    cv::Mat sample = cv::Mat(embedding).reshape(1, 1);
    cv::Mat results;
    cv::Mat responses;
    cv::Mat dists;
    knn_->findNearest(sample, k, results, responses, dists);

    responses.convertTo(responses, CV_32F);
    dists.convertTo(dists, CV_32F);

    std::vector<Neighbor> neighbors;
    neighbors.reserve(k);
    for (int i = 0; i < responses.cols; i++) {
        // OpenCV reports squared distances
        float squared = dists.at<float>(0, i);
        neighbors.push_back({cvRound(responses.at<float>(0, i)), std::sqrt(std::max(squared, 0.0f))});
    }
    return neighbors;
}

} // namespace facewatch
