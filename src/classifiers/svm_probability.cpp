#include "svm_probability.h"
#include <algorithm>
#include <cmath>

namespace facewatch {

namespace {

constexpr double MIN_PAIR_PROBABILITY = 1e-7;

}

double plattSigmoid(double decision_value, double a, double b) {
    double fApB = decision_value * a + b;
    if (fApB >= 0) {
        return std::exp(-fApB) / (1.0 + std::exp(-fApB));
    }
    return 1.0 / (1.0 + std::exp(fApB));
}

std::vector<double> couplePairwiseProbabilities(const std::vector<std::vector<double>>& r) {
    const int k = static_cast<int>(r.size());
    if (k == 0) return {};
    if (k == 1) return {1.0};

    std::vector<double> p(k, 1.0 / k);
    std::vector<std::vector<double>> Q(k, std::vector<double>(k, 0.0));
    std::vector<double> Qp(k, 0.0);

    for (int t = 0; t < k; t++) {
        Q[t][t] = 0;
        for (int j = 0; j < t; j++) {
            Q[t][t] += r[j][t] * r[j][t];
            Q[t][j] = Q[j][t];
        }
        for (int j = t + 1; j < k; j++) {
            Q[t][t] += r[j][t] * r[j][t];
            Q[t][j] = -r[j][t] * r[t][j];
        }
    }

    const int max_iter = std::max(100, k);
    const double eps = 0.005 / k;

    for (int iter = 0; iter < max_iter; iter++) {
        double pQp = 0;
        for (int t = 0; t < k; t++) {
            Qp[t] = 0;
            for (int j = 0; j < k; j++) {
                Qp[t] += Q[t][j] * p[j];
            }
            pQp += p[t] * Qp[t];
        }

        double max_error = 0;
        for (int t = 0; t < k; t++) {
            max_error = std::max(max_error, std::fabs(Qp[t] - pQp));
        }
        if (max_error < eps) {
            break;
        }

        for (int t = 0; t < k; t++) {
            double diff = (-Qp[t] + pQp) / Q[t][t];
            p[t] += diff;
            pQp = (pQp + diff * (diff * Q[t][t] + 2 * Qp[t])) / (1 + diff) / (1 + diff);
            for (int j = 0; j < k; j++) {
                Qp[j] = (Qp[j] + diff * Q[t][j]) / (1 + diff);
                p[j] /= (1 + diff);
            }
        }
    }

    return p;
}

std::optional<SvmDecisionSurface> SvmDecisionSurface::extract(const cv::Ptr<cv::ml::SVM>& svm,
                                                              const cv::FileNode& model_node,
                                                              const cv::FileNode& platt_node,
                                                              std::string& reason) {
    if (svm.empty() || !svm->isTrained()) {
        reason = "SVM is not trained";
        return std::nullopt;
    }

    int svm_type = svm->getType();
    if (svm_type != cv::ml::SVM::C_SVC && svm_type != cv::ml::SVM::NU_SVC) {
        reason = "SVM type " + std::to_string(svm_type) + " is not a classifier";
        return std::nullopt;
    }

    SvmDecisionSurface surface;
    surface.kernel_type_ = svm->getKernelType();
    if (surface.kernel_type_ == cv::ml::SVM::CUSTOM) {
        reason = "custom SVM kernels cannot be evaluated";
        return std::nullopt;
    }
    surface.gamma_ = svm->getGamma();
    surface.coef0_ = svm->getCoef0();
    surface.degree_ = svm->getDegree();
    surface.var_count_ = static_cast<size_t>(svm->getVarCount());

    cv::Mat labels;
    model_node["class_labels"] >> labels;
    if (labels.empty()) {
        reason = "SVM has no class_labels";
        return std::nullopt;
    }
    labels.convertTo(labels, CV_32S);
    labels = labels.reshape(1, 1);
    surface.class_labels_.assign(labels.ptr<int>(0), labels.ptr<int>(0) + labels.cols);

    svm->getSupportVectors().convertTo(surface.support_vectors_, CV_32F);

    const size_t classes = surface.class_labels_.size();
    const size_t pairs = classes * (classes - 1) / 2;
    surface.functions_.reserve(pairs);
    for (size_t i = 0; i < pairs; i++) {
        cv::Mat alpha;
        cv::Mat sv_index;
        DecisionFunction df;
        df.rho = svm->getDecisionFunction(static_cast<int>(i), alpha, sv_index);
        alpha.convertTo(alpha, CV_64F);
        sv_index.convertTo(sv_index, CV_32S);
        df.alpha.assign(alpha.ptr<double>(0), alpha.ptr<double>(0) + alpha.total());
        df.sv_index.assign(sv_index.ptr<int>(0), sv_index.ptr<int>(0) + sv_index.total());
        surface.functions_.push_back(std::move(df));
    }

    surface.platt_a_.assign(pairs, -1.0);
    surface.platt_b_.assign(pairs, 0.0);
    if (!platt_node.empty()) {
        std::vector<double> a;
        std::vector<double> b;
        platt_node["A"] >> a;
        platt_node["B"] >> b;
        if (a.size() != pairs || b.size() != pairs) {
            reason = "svm_probability needs " + std::to_string(pairs) + " A/B pairs";
            return std::nullopt;
        }
        surface.platt_a_ = std::move(a);
        surface.platt_b_ = std::move(b);
    }

    return surface;
}

std::string SvmDecisionSurface::kernelName() const {
    switch (kernel_type_) {
        case cv::ml::SVM::LINEAR:  return "linear";
        case cv::ml::SVM::POLY:    return "poly";
        case cv::ml::SVM::RBF:     return "rbf";
        case cv::ml::SVM::SIGMOID: return "sigmoid";
        case cv::ml::SVM::CHI2:    return "chi2";
        case cv::ml::SVM::INTER:   return "inter";
        default:                   return "unknown";
    }
}

double SvmDecisionSurface::kernel(const float* sv, const float* x) const {
    const int n = support_vectors_.cols;

    switch (kernel_type_) {
        case cv::ml::SVM::LINEAR:
        case cv::ml::SVM::POLY:
        case cv::ml::SVM::SIGMOID: {
            double dot = 0.0;
            for (int k = 0; k < n; k++) {
                dot += static_cast<double>(sv[k]) * x[k];
            }
            if (kernel_type_ == cv::ml::SVM::LINEAR) return dot;
            if (kernel_type_ == cv::ml::SVM::POLY) return std::pow(gamma_ * dot + coef0_, degree_);
            return std::tanh(gamma_ * dot + coef0_);
        }
        case cv::ml::SVM::RBF: {
            double dist = 0.0;
            for (int k = 0; k < n; k++) {
                double d = static_cast<double>(sv[k]) - x[k];
                dist += d * d;
            }
            return std::exp(-gamma_ * dist);
        }
        case cv::ml::SVM::CHI2: {
            double chi2 = 0.0;
            for (int k = 0; k < n; k++) {
                double d = static_cast<double>(sv[k]) - x[k];
                double divisor = static_cast<double>(sv[k]) + x[k];
                if (divisor != 0.0) chi2 += d * d / divisor;
            }
            return std::exp(-gamma_ * chi2);
        }
        case cv::ml::SVM::INTER: {
            double sum = 0.0;
            for (int k = 0; k < n; k++) {
                sum += std::min(sv[k], x[k]);
            }
            return sum;
        }
        default:
            return 0.0;
    }
}

std::vector<double> SvmDecisionSurface::decisionValues(const Embedding& embedding) const {
    std::vector<double> kernel_values(support_vectors_.rows);
    for (int i = 0; i < support_vectors_.rows; i++) {
        kernel_values[i] = kernel(support_vectors_.ptr<float>(i), embedding.data());
    }

    std::vector<double> values;
    values.reserve(functions_.size());
    for (const auto& df : functions_) {
        double sum = -df.rho;
        for (size_t k = 0; k < df.alpha.size(); k++) {
            sum += df.alpha[k] * kernel_values[df.sv_index[k]];
        }
        values.push_back(sum);
    }
    return values;
}

std::vector<double> SvmDecisionSurface::predictProba(const Embedding& embedding, size_t label_count) const {
    const size_t classes = class_labels_.size();
    std::vector<double> decisions = decisionValues(embedding);

    std::vector<std::vector<double>> r(classes, std::vector<double>(classes, 0.0));
    size_t pair = 0;
    for (size_t i = 0; i < classes; i++) {
        for (size_t j = i + 1; j < classes; j++, pair++) {
            double p = plattSigmoid(decisions[pair], platt_a_[pair], platt_b_[pair]);
            p = std::min(std::max(p, MIN_PAIR_PROBABILITY), 1.0 - MIN_PAIR_PROBABILITY);
            r[i][j] = p;
            r[j][i] = 1.0 - p;
        }
    }

    std::vector<double> coupled = couplePairwiseProbabilities(r);

    std::vector<double> proba(label_count, 0.0);
    for (size_t c = 0; c < classes; c++) {
        int label = class_labels_[c];
        if (label >= 0 && static_cast<size_t>(label) < label_count) {
            proba[label] = coupled[c];
        }
    }
    return proba;
}

} // namespace facewatch
