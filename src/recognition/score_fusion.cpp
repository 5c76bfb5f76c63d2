#include "score_fusion.h"
#include "../logger.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace facewatch {

namespace {

double clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

std::string formatPercent(double fraction) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return out.str();
}

} // namespace

double knnProbability(int first_run, int k, double nearest_distance) {
    if (k <= 0) return 0.0;
    double agreement = clamp01(2.0 * first_run / k - 0.5);
    double closeness = clamp01(2.5 - nearest_distance * 3.0);
    return agreement * closeness;
}

double svmProbability(double class_probability) {
    return clamp01(class_probability * 10.0);
}

std::optional<ScoreFusionEngine::Contribution> ScoreFusionEngine::evaluate(
    const ClassifierModel& model, const Embedding& embedding, const ClassLabelSpace& labels) const {

    if (embedding.size() != model.embeddingSize()) {
        Logger::getInstance().debug("Classifier " + model.displayName() + " expects embedding size " +
            std::to_string(model.embeddingSize()) + ", got " + std::to_string(embedding.size()) + ", skipped");
        return std::nullopt;
    }

    if (model.kind() == ClassifierKind::UNSUPPORTED) {
        Logger::getInstance().error("Unsupported model type in classifier " + model.displayName() +
                                    " (" + model.sourcePath() + ")");
        return std::nullopt;
    }

    try {
        std::vector<double> proba = model.predictProba(embedding, labels.size());
        if (proba.empty()) {
            return std::nullopt;
        }
        const int best = static_cast<int>(std::max_element(proba.begin(), proba.end()) - proba.begin());

        Contribution contribution;
        contribution.class_index = best;

        if (model.kind() == ClassifierKind::KNN) {
            int k = std::max(1, labels.class_stats[best].embeddings);
            k = std::min(k, model.referenceCount());

            std::vector<Neighbor> neighbors = model.nearestNeighbors(embedding, k);
            if (neighbors.empty()) {
                return std::nullopt;
            }

            int first_run = 0;
            for (const auto& neighbor : neighbors) {
                if (neighbor.class_index != best) break;
                first_run++;
            }
            const double nearest = neighbors.front().distance;

            contribution.probability = knnProbability(first_run, k, nearest);

            std::ostringstream evidence;
            evidence << std::fixed << std::setprecision(3) << nearest << " " << first_run << "/" << k;
            contribution.evidence = evidence.str();
        } else {
            contribution.probability = svmProbability(proba[best]);
            contribution.evidence = formatPercent(proba[best]);
        }

        return contribution;
    } catch (const cv::Exception& e) {
        Logger::getInstance().debug("Classifier " + model.displayName() + " failed: " + e.what() + ", skipped");
        return std::nullopt;
    }
}

FaceVerdict ScoreFusionEngine::score(const Embedding& embedding, const ClassifierEnsemble& ensemble) const {
    FaceVerdict verdict;
    const ClassLabelSpace& labels = ensemble.labels();

    std::vector<Contribution> contributions;
    for (const auto& model : ensemble.models()) {
        auto contribution = evaluate(model, embedding, labels);
        if (!contribution) continue;

        if (debug_) {
            verdict.debug_lines.push_back(model.displayName() + ": " + formatPercent(contribution->probability) +
                " " + labels.class_names[contribution->class_index] + " (" + contribution->evidence + ")");
        }
        contributions.push_back(std::move(*contribution));
    }

    bool detected = !contributions.empty();
    double sum = 0.0;
    for (const auto& c : contributions) {
        if (c.class_index != contributions.front().class_index || c.probability <= 0.0) {
            detected = false;
        }
        sum += c.probability;
    }

    verdict.detected = detected;
    if (detected) {
        verdict.label = labels.class_names[contributions.front().class_index];
        verdict.confidence = static_cast<float>(sum / contributions.size());
        verdict.hint = RenderHint::detected();
    } else {
        verdict.hint = RenderHint::notDetected();
    }

    if (debug_) {
        if (detected) {
            verdict.debug_lines.push_back("Summary: " + formatPercent(verdict.confidence) + " " + *verdict.label);
        } else {
            verdict.debug_lines.push_back("Summary: not detected");
        }

        std::string text;
        for (const auto& line : verdict.debug_lines) {
            if (!text.empty()) text += "\n";
            text += line;
        }
        verdict.overlay_text = text;
    } else if (detected) {
        verdict.overlay_text = verdict.label;
    }

    return verdict;
}

} // namespace facewatch
