#ifndef FACEWATCH_SVM_PROBABILITY_H
#define FACEWATCH_SVM_PROBABILITY_H

#include "../embedding_config.h"
#include <opencv2/core.hpp>
#include <opencv2/ml.hpp>
#include <optional>
#include <string>
#include <vector>

namespace facewatch {

// Platt sigmoid 1 / (1 + exp(a*f + b)), evaluated without overflow
double plattSigmoid(double decision_value, double a, double b);

// Combine one-vs-one pairwise probabilities into a single distribution.
// r[i][j] is the probability that class i beats class j (r[j][i] = 1 - r[i][j]).
// Iterative coupling of Wu, Lin & Weng (the method libsvm uses).
std::vector<double> couplePairwiseProbabilities(const std::vector<std::vector<double>>& r);

// Decision surface of a trained OpenCV SVM classifier, extracted once at load
// time so probability estimates can be computed without OpenCV's vote-only
// predict(). Immutable after extraction.
class SvmDecisionSurface {
public:
    // model_node is the "opencv_ml_svm" node the SVM was read from (it carries
    // class_labels), platt_node the optional "svm_probability" node with
    // per-pair A/B parameters. Returns nullopt and sets reason for SVMs that
    // cannot produce class probabilities (regression/one-class, custom kernel).
    static std::optional<SvmDecisionSurface> extract(const cv::Ptr<cv::ml::SVM>& svm,
                                                     const cv::FileNode& model_node,
                                                     const cv::FileNode& platt_node,
                                                     std::string& reason);

    size_t varCount() const { return var_count_; }
    size_t classCount() const { return class_labels_.size(); }
    const std::vector<int>& classLabels() const { return class_labels_; }
    std::string kernelName() const;

    // Raw one-vs-one decision values, pairs ordered (0,1), (0,2) .. (1,2) ..
    std::vector<double> decisionValues(const Embedding& embedding) const;

    // Probability per label-space index (labels absent from the SVM get 0)
    std::vector<double> predictProba(const Embedding& embedding, size_t label_count) const;

private:
    struct DecisionFunction {
        double rho = 0.0;
        std::vector<double> alpha;
        std::vector<int> sv_index;
    };

    SvmDecisionSurface() = default;

    double kernel(const float* sv, const float* x) const;

    int kernel_type_ = cv::ml::SVM::LINEAR;
    double gamma_ = 1.0;
    double coef0_ = 0.0;
    double degree_ = 1.0;
    size_t var_count_ = 0;

    cv::Mat support_vectors_;  // CV_32F, one row per support vector
    std::vector<DecisionFunction> functions_;
    std::vector<int> class_labels_;
    std::vector<double> platt_a_;
    std::vector<double> platt_b_;
};

} // namespace facewatch

#endif // FACEWATCH_SVM_PROBABILITY_H
