#ifndef FACEWATCH_ENSEMBLE_STORE_H
#define FACEWATCH_ENSEMBLE_STORE_H

#include "classifier_ensemble.h"
#include <memory>
#include <mutex>
#include <string>

namespace facewatch {

// Owns the current classifier ensemble. Readers take one snapshot per frame;
// reload() builds a replacement outside the lock and swaps it in.
class EnsembleStore {
public:
    explicit EnsembleStore(std::string classifiers_dir, EnsembleLoadOptions options = {});

    // Returns false (and keeps the previous ensemble) when loading fails
    bool reload();

    std::shared_ptr<const ClassifierEnsemble> current() const;

private:
    std::string classifiers_dir_;
    EnsembleLoadOptions options_;

    mutable std::mutex mutex_;
    std::shared_ptr<const ClassifierEnsemble> current_;
};

} // namespace facewatch

#endif // FACEWATCH_ENSEMBLE_STORE_H
