#include "classifier_ensemble.h"
#include "../errors.h"
#include "../logger.h"
#include <algorithm>
#include <dirent.h>
#include <fnmatch.h>

namespace facewatch {

namespace {

const char* const ARTIFACT_PATTERNS[] = {
    "*.yml", "*.yaml", "*.xml", "*.json",
    "*.yml.gz", "*.yaml.gz", "*.xml.gz", "*.json.gz"
};

const std::string MODEL_NODE_PREFIX = "opencv_ml_";

// One parsed artifact before it joins the ensemble
struct Artifact {
    std::string path;
    std::string model_type;
    cv::FileNode model_node;
    cv::FileNode platt_node;
    ClassLabelSpace labels;
};

ClassLabelSpace readLabelSpace(const cv::FileStorage& fs, const std::string& path, TextEncoding encoding) {
    ClassLabelSpace labels;

    cv::FileNode names = fs["class_names"];
    if (names.empty() || !names.isSeq()) {
        throw ArtifactError(path, "missing class_names sequence");
    }
    for (const auto& name : names) {
        if (!name.isString()) {
            throw ArtifactError(path, "class_names entries must be strings");
        }
        std::string value = static_cast<std::string>(name);
        if (encoding == TextEncoding::LATIN1) {
            value = EnsembleLoader::latin1ToUtf8(value);
        }
        labels.class_names.push_back(value);
    }

    cv::FileNode stats = fs["class_stats"];
    if (stats.empty() || !stats.isSeq()) {
        throw ArtifactError(path, "missing class_stats sequence");
    }
    if (stats.size() != labels.class_names.size()) {
        throw ArtifactError(path, "class_stats has " + std::to_string(stats.size()) + " entries for " +
                                  std::to_string(labels.class_names.size()) + " classes");
    }
    for (const auto& entry : stats) {
        if (!entry.isMap()) {
            throw ArtifactError(path, "class_stats entries must be maps");
        }
        cv::FileNode embeddings = entry["embeddings"];
        if (embeddings.empty() || !embeddings.isInt()) {
            throw ArtifactError(path, "class_stats entry without integer 'embeddings'");
        }

        ClassStats class_stats;
        class_stats.embeddings = static_cast<int>(embeddings);
        for (const auto& field : entry) {
            if (field.name() == "embeddings" || !(field.isInt() || field.isReal())) {
                continue;
            }
            class_stats.attributes[field.name()] = static_cast<double>(field);
        }
        labels.class_stats.push_back(std::move(class_stats));
    }

    return labels;
}

void checkResponses(const cv::Mat& responses, size_t class_count, const std::string& path) {
    cv::Mat indices;
    responses.convertTo(indices, CV_32S);
    for (auto it = indices.begin<int>(); it != indices.end<int>(); ++it) {
        if (*it < 0 || static_cast<size_t>(*it) >= class_count) {
            throw ArtifactError(path, "class index " + std::to_string(*it) + " outside class_names");
        }
    }
}

ClassifierModel buildModel(const Artifact& artifact, size_t index) {
    const size_t class_count = artifact.labels.size();

    if (artifact.model_type == "opencv_ml_knn") {
        cv::Ptr<cv::ml::KNearest> knn = cv::ml::KNearest::create();
        knn->read(artifact.model_node);
        if (!knn->isTrained() || !knn->isClassifier()) {
            throw ArtifactError(artifact.path, "KNearest model has no reference set");
        }
        cv::Mat samples;
        cv::Mat responses;
        artifact.model_node["samples"] >> samples;
        artifact.model_node["responses"] >> responses;
        checkResponses(responses, class_count, artifact.path);
        return ClassifierModel::fromKNearest(knn, samples.rows, artifact.path);
    }

    if (artifact.model_type == "opencv_ml_svm") {
        cv::Ptr<cv::ml::SVM> svm = cv::ml::SVM::create();
        svm->read(artifact.model_node);

        std::string reason;
        auto surface = SvmDecisionSurface::extract(svm, artifact.model_node, artifact.platt_node, reason);
        if (!surface) {
            Logger::getInstance().warning("Classifier " + artifact.path + " cannot produce probabilities (" +
                                          reason + "), treating as unsupported");
            return ClassifierModel::unsupported(artifact.model_type, index, artifact.path);
        }
        cv::Mat labels(surface->classLabels(), false);
        checkResponses(labels, class_count, artifact.path);
        return ClassifierModel::fromSvm(std::move(*surface), artifact.path);
    }

    return ClassifierModel::unsupported(artifact.model_type, index, artifact.path);
}

} // namespace

ClassifierEnsemble::ClassifierEnsemble(std::vector<ClassifierModel> models, ClassLabelSpace labels)
    : models_(std::move(models)), labels_(std::move(labels)) {}

TextEncoding parseTextEncoding(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "latin1" || lower == "latin-1") {
        return TextEncoding::LATIN1;
    }
    return TextEncoding::UTF8;
}

std::string EnsembleLoader::latin1ToUtf8(const std::string& text) {
    std::string out;
    out.reserve(text.size() * 2);
    for (unsigned char c : text) {
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

std::vector<std::string> EnsembleLoader::findArtifacts(const std::string& directory) {
    std::vector<std::string> files;

    DIR* dir = opendir(directory.c_str());
    if (!dir) {
        return files;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string filename = entry->d_name;
        for (const char* pattern : ARTIFACT_PATTERNS) {
            if (fnmatch(pattern, filename.c_str(), 0) == 0) {
                files.push_back(directory + "/" + filename);
                break;
            }
        }
    }
    closedir(dir);

    std::sort(files.begin(), files.end());
    return files;
}

ClassifierEnsemble EnsembleLoader::load(const std::string& directory, const EnsembleLoadOptions& options) {
    auto& logger = Logger::getInstance();

    std::vector<std::string> paths = findArtifacts(directory);
    if (paths.empty()) {
        logger.info("No classifiers in " + directory + ", running detection only");
        return ClassifierEnsemble();
    }

    std::vector<ClassifierModel> models;
    ClassLabelSpace reference;

    for (size_t index = 0; index < paths.size(); index++) {
        const std::string& path = paths[index];

        cv::FileStorage fs;
        try {
            if (!fs.open(path, cv::FileStorage::READ)) {
                throw ArtifactError(path, "cannot open");
            }
        } catch (const cv::Exception& e) {
            throw ArtifactError(path, e.what());
        }

        Artifact artifact;
        artifact.path = path;
        for (const auto& node : fs.root()) {
            if (node.name().compare(0, MODEL_NODE_PREFIX.size(), MODEL_NODE_PREFIX) == 0) {
                artifact.model_type = node.name();
                artifact.model_node = node;
                break;
            }
        }
        if (artifact.model_type.empty()) {
            throw ArtifactError(path, "no opencv_ml_* model node");
        }

        artifact.platt_node = fs["svm_probability"];
        artifact.labels = readLabelSpace(fs, path, options.encoding);

        if (index == 0) {
            reference = artifact.labels;
        } else if (artifact.labels.class_names != reference.class_names) {
            throw ConsistencyError("class names of " + path + " differ from " + paths[0]);
        } else if (artifact.labels.class_stats != reference.class_stats) {
            throw ConsistencyError("class statistics of " + path + " differ from " + paths[0]);
        }

        try {
            models.push_back(buildModel(artifact, index));
        } catch (const cv::Exception& e) {
            throw ArtifactError(path, e.what());
        }

        logger.debug("Loaded " + models.back().describe() + " from " + path);
    }

    logger.info("Loaded " + std::to_string(models.size()) + " classifier(s) over " +
                std::to_string(reference.size()) + " classes from " + directory);

    return ClassifierEnsemble(std::move(models), std::move(reference));
}

} // namespace facewatch
