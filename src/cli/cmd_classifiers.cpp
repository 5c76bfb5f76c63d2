#include "commands.h"
#include "cli_common.h"
#include "../classifiers/classifier_ensemble.h"
#include "../errors.h"

namespace facewatch {

int cmd_classifiers(const std::string& directory) {
    cli::setupConsoleLogging(false);
    Config& config = cli::loadDefaultConfig();

    std::string dir = directory.empty() ? cli::getClassifiersDir() : directory;

    EnsembleLoadOptions options;
    options.encoding = parseTextEncoding(config.getString("recognition", "classifier_encoding").value_or("utf-8"));

    ClassifierEnsemble ensemble;
    try {
        ensemble = EnsembleLoader::load(dir, options);
    } catch (const ConsistencyError& e) {
        std::cerr << "Inconsistent classifiers in " << dir << ": " << e.what() << std::endl;
        return 1;
    } catch (const ArtifactError& e) {
        std::cerr << "Cannot load classifier " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Classifier directory: " << dir << std::endl;
    if (ensemble.empty()) {
        std::cout << "No classifiers found (detection only)" << std::endl;
        return 0;
    }

    std::cout << std::endl << "Classifiers (" << ensemble.size() << "):" << std::endl;
    for (const auto& model : ensemble.models()) {
        std::cout << "  " << std::left << std::setw(12) << model.displayName()
                  << model.describe() << std::endl;
        std::cout << "  " << std::setw(12) << "" << model.sourcePath() << std::endl;
    }

    const ClassLabelSpace& labels = ensemble.labels();
    std::cout << std::endl << "Classes (" << labels.size() << "):" << std::endl;
    for (size_t i = 0; i < labels.size(); i++) {
        std::cout << "  " << std::right << std::setw(3) << i << "  " << std::left << std::setw(32)
                  << labels.class_names[i] << labels.class_stats[i].embeddings << " embeddings" << std::endl;
    }

    int unsupported = 0;
    for (const auto& model : ensemble.models()) {
        if (model.kind() == ClassifierKind::UNSUPPORTED) unsupported++;
    }
    if (unsupported > 0) {
        std::cout << std::endl << "Warning: " << unsupported
                  << " classifier(s) of unsupported kind will be skipped" << std::endl;
    }

    return 0;
}

} // namespace facewatch
