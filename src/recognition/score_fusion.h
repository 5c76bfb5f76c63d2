#ifndef FACEWATCH_SCORE_FUSION_H
#define FACEWATCH_SCORE_FUSION_H

#include "face_verdict.h"
#include "../classifiers/classifier_ensemble.h"
#include "../embedding_config.h"

namespace facewatch {

// kNN confidence: leading run of the predicted class among its k nearest
// references, scaled by distance to the nearest one.
//   clamp01(2*first_run/k - 0.5) * clamp01(2.5 - 3*d)
// Below 25% agreement is 0, above 75% is 1; d <= 0.5 is 1, d >= 0.833 is 0.
double knnProbability(int first_run, int k, double nearest_distance);

// SVM confidence: clamp01(10 * p), p being the predicted class probability
double svmProbability(double class_probability);

class ScoreFusionEngine {
public:
    explicit ScoreFusionEngine(bool debug = false) : debug_(debug) {}

    void setDebug(bool debug) { debug_ = debug; }
    bool debug() const { return debug_; }

    // Fuse every classifier's opinion about one face embedding. The
    // bounding box of the returned verdict is left for the caller to set.
    // A face is detected only if at least one classifier contributed, all
    // contributors agree on the class and every contributor is confident
    // (probability > 0).
    FaceVerdict score(const Embedding& embedding, const ClassifierEnsemble& ensemble) const;

private:
    struct Contribution {
        int class_index;
        double probability;
        std::string evidence;
    };

    std::optional<Contribution> evaluate(const ClassifierModel& model, const Embedding& embedding,
                                         const ClassLabelSpace& labels) const;

    bool debug_;
};

} // namespace facewatch

#endif // FACEWATCH_SCORE_FUSION_H
