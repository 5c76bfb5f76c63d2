#include "ensemble_store.h"
#include "../errors.h"
#include "../logger.h"

namespace facewatch {

EnsembleStore::EnsembleStore(std::string classifiers_dir, EnsembleLoadOptions options)
    : classifiers_dir_(std::move(classifiers_dir)),
      options_(options),
      current_(std::make_shared<const ClassifierEnsemble>()) {}

bool EnsembleStore::reload() {
    auto& logger = Logger::getInstance();

    std::shared_ptr<const ClassifierEnsemble> loaded;
    try {
        loaded = std::make_shared<const ClassifierEnsemble>(EnsembleLoader::load(classifiers_dir_, options_));
    } catch (const ConsistencyError& e) {
        logger.error("Classifier ensemble is inconsistent: " + std::string(e.what()));
        logger.auditReload(classifiers_dir_, 0, false);
        return false;
    } catch (const ArtifactError& e) {
        logger.error("Failed to load classifier " + std::string(e.what()));
        logger.auditReload(classifiers_dir_, 0, false);
        return false;
    }

    const size_t count = loaded->size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(loaded);
    }
    logger.auditReload(classifiers_dir_, count, true);
    return true;
}

std::shared_ptr<const ClassifierEnsemble> EnsembleStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

} // namespace facewatch
