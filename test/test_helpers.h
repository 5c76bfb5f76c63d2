#ifndef FACEWATCH_TEST_HELPERS_H
#define FACEWATCH_TEST_HELPERS_H

#include <opencv2/core.hpp>
#include <opencv2/ml.hpp>
#include <dirent.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>
#include <vector>

namespace facewatch {
namespace testutil {

// mkdtemp directory, removed with its files on destruction
class TempDir {
public:
    TempDir() {
        char pattern[] = "/tmp/facewatch_test_XXXXXX";
        char* dir = mkdtemp(pattern);
        path_ = dir ? dir : "";
    }

    ~TempDir() {
        if (path_.empty()) return;
        DIR* dir = opendir(path_.c_str());
        if (dir) {
            struct dirent* entry;
            while ((entry = readdir(dir)) != nullptr) {
                std::string name = entry->d_name;
                if (name != "." && name != "..") {
                    std::remove((path_ + "/" + name).c_str());
                }
            }
            closedir(dir);
        }
        rmdir(path_.c_str());
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

// Two well separated 4-d clusters: class 0 ("alice") around the origin,
// class 1 ("bob") around (1,1,1,1). Four samples each.
inline cv::Mat clusterSamples() {
    float data[8][4] = {
        {0.0f, 0.0f, 0.0f, 0.0f},
        {0.1f, 0.0f, 0.0f, 0.0f},
        {0.0f, 0.1f, 0.0f, 0.0f},
        {0.0f, 0.0f, 0.1f, 0.0f},
        {1.0f, 1.0f, 1.0f, 1.0f},
        {0.9f, 1.0f, 1.0f, 1.0f},
        {1.0f, 0.9f, 1.0f, 1.0f},
        {1.0f, 1.0f, 0.9f, 1.0f},
    };
    return cv::Mat(8, 4, CV_32F, data).clone();
}

inline std::vector<int> clusterLabels(bool swapped = false) {
    std::vector<int> labels = {0, 0, 0, 0, 1, 1, 1, 1};
    if (swapped) {
        for (auto& l : labels) l = 1 - l;
    }
    return labels;
}

inline cv::Ptr<cv::ml::KNearest> trainKnn(const cv::Mat& samples, const std::vector<int>& labels, int default_k) {
    cv::Mat responses(static_cast<int>(labels.size()), 1, CV_32F);
    for (size_t i = 0; i < labels.size(); i++) {
        responses.at<float>(static_cast<int>(i), 0) = static_cast<float>(labels[i]);
    }
    cv::Ptr<cv::ml::KNearest> knn = cv::ml::KNearest::create();
    knn->setDefaultK(default_k);
    knn->setIsClassifier(true);
    knn->train(samples, cv::ml::ROW_SAMPLE, responses);
    return knn;
}

inline cv::Ptr<cv::ml::SVM> trainSvm(const cv::Mat& samples, const std::vector<int>& labels,
                                     int kernel = cv::ml::SVM::LINEAR) {
    cv::Mat responses(static_cast<int>(labels.size()), 1, CV_32S);
    for (size_t i = 0; i < labels.size(); i++) {
        responses.at<int>(static_cast<int>(i), 0) = labels[i];
    }
    cv::Ptr<cv::ml::SVM> svm = cv::ml::SVM::create();
    svm->setType(cv::ml::SVM::C_SVC);
    svm->setKernel(kernel);
    svm->setC(10.0);
    if (kernel == cv::ml::SVM::RBF) {
        svm->setGamma(1.0);
    }
    svm->setTermCriteria(cv::TermCriteria(cv::TermCriteria::MAX_ITER + cv::TermCriteria::EPS, 1000, 1e-6));
    svm->train(samples, cv::ml::ROW_SAMPLE, responses);
    return svm;
}

// Write a classifier artifact: model node, class_names, class_stats
inline void writeArtifact(const std::string& path, const cv::Ptr<cv::ml::StatModel>& model,
                          const std::vector<std::string>& names, const std::vector<int>& embeddings,
                          double extra_attribute = -1.0) {
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    fs << model->getDefaultName() << "{";
    model->write(fs);
    fs << "}";

    fs << "class_names" << "[";
    for (const auto& name : names) {
        fs << name;
    }
    fs << "]";

    fs << "class_stats" << "[";
    for (int count : embeddings) {
        fs << "{" << "embeddings" << count;
        if (extra_attribute >= 0.0) {
            fs << "mean_distance" << extra_attribute;
        }
        fs << "}";
    }
    fs << "]";
    fs.release();
}

// Artifact whose model node is of a kind the loader does not evaluate
inline void writeUnsupportedArtifact(const std::string& path, const std::vector<std::string>& names,
                                     const std::vector<int>& embeddings) {
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    fs << "opencv_ml_boost" << "{" << "format" << 3 << "ntrees" << 0 << "}";
    fs << "class_names" << "[";
    for (const auto& name : names) {
        fs << name;
    }
    fs << "]";
    fs << "class_stats" << "[";
    for (int count : embeddings) {
        fs << "{" << "embeddings" << count << "}";
    }
    fs << "]";
    fs.release();
}

// The standard two-class ensemble: a kNN and an SVM over the clusters
inline void writeClusterEnsemble(const std::string& dir, bool svm_swapped = false) {
    cv::Mat samples = clusterSamples();
    writeArtifact(dir + "/a_knn.yml", trainKnn(samples, clusterLabels(), 3), {"alice", "bob"}, {4, 4});
    writeArtifact(dir + "/b_svm.yml", trainSvm(samples, clusterLabels(svm_swapped)), {"alice", "bob"}, {4, 4});
}

} // namespace testutil
} // namespace facewatch

#endif // FACEWATCH_TEST_HELPERS_H
