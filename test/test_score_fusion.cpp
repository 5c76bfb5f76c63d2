#include "classifiers/classifier_ensemble.h"
#include "recognition/score_fusion.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <algorithm>

using namespace facewatch;
using facewatch::testutil::TempDir;

namespace {

Embedding aliceEmbedding() { return {0.0f, 0.0f, 0.0f, 0.0f}; }
Embedding bobEmbedding() { return {1.0f, 1.0f, 1.0f, 1.0f}; }

// References along the first axis: alice at 0.0, bob at 0.1, alice at 0.2, 0.3 and 0.4.
// alice has 4 training embeddings, so kNN scoring looks at 4 neighbors.
void writeInterleavedKnn(const std::string& path) {
    float data[5][4] = {
        {0.0f, 0.0f, 0.0f, 0.0f},
        {0.1f, 0.0f, 0.0f, 0.0f},
        {0.2f, 0.0f, 0.0f, 0.0f},
        {0.3f, 0.0f, 0.0f, 0.0f},
        {0.4f, 0.0f, 0.0f, 0.0f},
    };
    cv::Mat samples = cv::Mat(5, 4, CV_32F, data).clone();
    testutil::writeArtifact(path, testutil::trainKnn(samples, {0, 1, 0, 0, 0}, 3), {"alice", "bob"}, {4, 1});
}

} // namespace

TEST(KnnProbability, AgreementAndDistanceTerms) {
    EXPECT_NEAR(knnProbability(7, 10, 0.4), 0.9, 1e-9);
    EXPECT_DOUBLE_EQ(knnProbability(10, 10, 0.0), 1.0);
    // agreement below 25% is worthless
    EXPECT_DOUBLE_EQ(knnProbability(2, 10, 0.0), 0.0);
    // too far away
    EXPECT_DOUBLE_EQ(knnProbability(10, 10, 0.9), 0.0);
    EXPECT_NEAR(knnProbability(10, 10, 0.6), 0.7, 1e-9);
}

TEST(KnnProbability, NonPositiveKIsZero) {
    EXPECT_DOUBLE_EQ(knnProbability(0, 0, 0.0), 0.0);
}

TEST(SvmProbability, ScalesAndClamps) {
    EXPECT_DOUBLE_EQ(svmProbability(0.0), 0.0);
    EXPECT_NEAR(svmProbability(0.05), 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(svmProbability(0.12), 1.0);
    EXPECT_DOUBLE_EQ(svmProbability(0.9), 1.0);
}

class ScoreFusionTest : public ::testing::Test {
protected:
    ClassifierEnsemble loadEnsemble(bool svm_swapped = false) {
        testutil::writeClusterEnsemble(dir_.path(), svm_swapped);
        return EnsembleLoader::load(dir_.path());
    }

    TempDir dir_;
};

TEST_F(ScoreFusionTest, AgreeingClassifiersDetect) {
    ClassifierEnsemble ensemble = loadEnsemble();
    ASSERT_EQ(ensemble.size(), 2u);

    ScoreFusionEngine engine;
    FaceVerdict verdict = engine.score(aliceEmbedding(), ensemble);

    EXPECT_TRUE(verdict.detected);
    ASSERT_TRUE(verdict.label.has_value());
    EXPECT_EQ(*verdict.label, "alice");
    EXPECT_GT(verdict.confidence, 0.9f);
    EXPECT_LE(verdict.confidence, 1.0f);
    EXPECT_TRUE(verdict.hint.thick);
    ASSERT_TRUE(verdict.overlay_text.has_value());
    EXPECT_EQ(*verdict.overlay_text, "alice");
    EXPECT_TRUE(verdict.debug_lines.empty());
}

TEST_F(ScoreFusionTest, OtherClassDetected) {
    ClassifierEnsemble ensemble = loadEnsemble();
    FaceVerdict verdict = ScoreFusionEngine().score(bobEmbedding(), ensemble);

    EXPECT_TRUE(verdict.detected);
    ASSERT_TRUE(verdict.label.has_value());
    EXPECT_EQ(*verdict.label, "bob");
}

TEST_F(ScoreFusionTest, DisagreementIsNotDetected) {
    ClassifierEnsemble ensemble = loadEnsemble(true);
    FaceVerdict verdict = ScoreFusionEngine().score(aliceEmbedding(), ensemble);

    EXPECT_FALSE(verdict.detected);
    EXPECT_FALSE(verdict.label.has_value());
    EXPECT_FALSE(verdict.hint.thick);
    EXPECT_FALSE(verdict.overlay_text.has_value());
}

TEST_F(ScoreFusionTest, DebugLinesPerClassifierAndSummary) {
    ClassifierEnsemble ensemble = loadEnsemble();
    ScoreFusionEngine engine(true);
    FaceVerdict verdict = engine.score(aliceEmbedding(), ensemble);

    ASSERT_EQ(verdict.debug_lines.size(), 3u);
    EXPECT_EQ(verdict.debug_lines[0].rfind("kNN: ", 0), 0u);
    EXPECT_NE(verdict.debug_lines[0].find("alice"), std::string::npos);
    EXPECT_EQ(verdict.debug_lines[1].rfind("SVM: ", 0), 0u);
    EXPECT_EQ(verdict.debug_lines[2].rfind("Summary: ", 0), 0u);
    ASSERT_TRUE(verdict.overlay_text.has_value());
    EXPECT_EQ(std::count(verdict.overlay_text->begin(), verdict.overlay_text->end(), '\n'), 2);
}

TEST_F(ScoreFusionTest, DeterministicForSameInput) {
    ClassifierEnsemble ensemble = loadEnsemble();
    ScoreFusionEngine engine(true);
    FaceVerdict first = engine.score(aliceEmbedding(), ensemble);
    FaceVerdict second = engine.score(aliceEmbedding(), ensemble);

    EXPECT_EQ(first.detected, second.detected);
    EXPECT_EQ(first.label, second.label);
    EXPECT_FLOAT_EQ(first.confidence, second.confidence);
    EXPECT_EQ(first.debug_lines, second.debug_lines);
}

TEST_F(ScoreFusionTest, WrongEmbeddingSizeSkipsEveryClassifier) {
    ClassifierEnsemble ensemble = loadEnsemble();
    Embedding wide(DEFAULT_EMBEDDING_SIZE, 0.0f);
    FaceVerdict verdict = ScoreFusionEngine(true).score(wide, ensemble);

    EXPECT_FALSE(verdict.detected);
    ASSERT_EQ(verdict.debug_lines.size(), 1u);
    EXPECT_EQ(verdict.debug_lines[0], "Summary: not detected");
}

TEST_F(ScoreFusionTest, FarFromEveryReferenceIsNotDetected) {
    ClassifierEnsemble ensemble = loadEnsemble();
    // kNN distance term drops to zero far from the references
    FaceVerdict verdict = ScoreFusionEngine().score({-3.0f, -3.0f, -3.0f, -3.0f}, ensemble);
    EXPECT_FALSE(verdict.detected);
}

TEST_F(ScoreFusionTest, KnnCountsOnlyTheLeadingRun) {
    writeInterleavedKnn(dir_.file("knn.yml"));
    ClassifierEnsemble ensemble = EnsembleLoader::load(dir_.path());
    ASSERT_EQ(ensemble.size(), 1u);

    // Neighbors alice, bob, alice, alice: three of four agree but the run stops at bob
    FaceVerdict verdict = ScoreFusionEngine(true).score({0.0f, 0.0f, 0.0f, 0.0f}, ensemble);
    EXPECT_FALSE(verdict.detected);
    ASSERT_EQ(verdict.debug_lines.size(), 2u);
    EXPECT_EQ(verdict.debug_lines[0], "kNN: 0.0% alice (0.000 1/4)");
}

TEST_F(ScoreFusionTest, KnnLeadingRunBeforeOtherClass) {
    writeInterleavedKnn(dir_.file("knn.yml"));
    ClassifierEnsemble ensemble = EnsembleLoader::load(dir_.path());

    // Neighbors alice, alice, alice, bob
    FaceVerdict verdict = ScoreFusionEngine(true).score({0.4f, 0.0f, 0.0f, 0.0f}, ensemble);
    EXPECT_TRUE(verdict.detected);
    ASSERT_TRUE(verdict.label.has_value());
    EXPECT_EQ(*verdict.label, "alice");
    EXPECT_FLOAT_EQ(verdict.confidence, 1.0f);
    ASSERT_EQ(verdict.debug_lines.size(), 2u);
    EXPECT_EQ(verdict.debug_lines[0], "kNN: 100.0% alice (0.000 3/4)");
}

TEST_F(ScoreFusionTest, SkippedClassifiersLeaveTheRestToDecide) {
    cv::Mat samples = testutil::clusterSamples();
    testutil::writeArtifact(dir_.file("a_knn.yml"), testutil::trainKnn(samples, testutil::clusterLabels(), 3),
                            {"alice", "bob"}, {4, 4});
    testutil::writeUnsupportedArtifact(dir_.file("b_boost.yml"), {"alice", "bob"}, {4, 4});
    cv::Mat narrow = samples.colRange(0, 3).clone();
    testutil::writeArtifact(dir_.file("c_svm.yml"), testutil::trainSvm(narrow, testutil::clusterLabels()),
                            {"alice", "bob"}, {4, 4});

    ClassifierEnsemble ensemble = EnsembleLoader::load(dir_.path());
    ASSERT_EQ(ensemble.size(), 3u);
    EXPECT_EQ(ensemble.models()[1].kind(), ClassifierKind::UNSUPPORTED);
    EXPECT_EQ(ensemble.models()[2].embeddingSize(), 3u);

    FaceVerdict verdict = ScoreFusionEngine(true).score(aliceEmbedding(), ensemble);
    EXPECT_TRUE(verdict.detected);
    ASSERT_TRUE(verdict.label.has_value());
    EXPECT_EQ(*verdict.label, "alice");
    EXPECT_FLOAT_EQ(verdict.confidence, 1.0f);
    // Only the kNN contributed
    ASSERT_EQ(verdict.debug_lines.size(), 2u);
    EXPECT_EQ(verdict.debug_lines[0].rfind("kNN: ", 0), 0u);
    EXPECT_EQ(verdict.debug_lines[1], "Summary: 100.0% alice");
}

TEST(ScoreFusion, FailingClassifierIsSkipped) {
    // Reference set never trained: queries against it fail inside OpenCV
    ClassifierModel broken = ClassifierModel::fromKNearest(cv::ml::KNearest::create(), 4, "broken.yml");
    ASSERT_EQ(broken.embeddingSize(), 0u);

    ClassStats stats;
    stats.embeddings = 4;
    ClassLabelSpace labels;
    labels.class_names = {"alice", "bob"};
    labels.class_stats = {stats, stats};
    ClassifierEnsemble ensemble({broken}, labels);

    FaceVerdict verdict;
    EXPECT_NO_THROW(verdict = ScoreFusionEngine(true).score(Embedding(), ensemble));
    EXPECT_FALSE(verdict.detected);
    ASSERT_EQ(verdict.debug_lines.size(), 1u);
    EXPECT_EQ(verdict.debug_lines[0], "Summary: not detected");
}

TEST(ScoreFusion, EmptyEnsembleIsNotDetected) {
    ClassifierEnsemble ensemble;
    FaceVerdict verdict = ScoreFusionEngine().score(aliceEmbedding(), ensemble);
    EXPECT_FALSE(verdict.detected);
    EXPECT_FALSE(verdict.label.has_value());
}
