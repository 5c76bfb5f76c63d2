#include "config.h"
#include "notify/jpeg_encoder.h"
#include "notify/notifier.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace facewatch;
using facewatch::testutil::TempDir;

TEST(PrintNotifierBanner, NameOnly) {
    Notification notification;
    notification.name = "Jane Doe";

    const std::string line = "Jane Doe has been detected";
    const std::string ruler(line.size(), '=');
    EXPECT_EQ(PrintNotifier::formatBanner(notification), ruler + "\n" + line + "\n" + ruler);
}

TEST(PrintNotifierBanner, FullRecord) {
    Notification notification;
    notification.name = "Jane";
    notification.position = "Chief Executive Officer";
    notification.company = "ACME";
    notification.image = cv::Mat(4, 4, CV_8UC3, cv::Scalar(1, 2, 3));

    std::string banner = PrintNotifier::formatBanner(notification);
    const std::string ruler(std::string("Position: Chief Executive Officer").size(), '=');
    EXPECT_EQ(banner,
              ruler + "\n"
              "Jane has been detected\n"
              "Position: Chief Executive Officer\n"
              "Company: ACME\n"
              "[IMAGE]\n" + ruler);
}

TEST(PrintNotifier, PrintsBannerLine) {
    std::ostringstream out;
    PrintNotifier notifier(out);

    Notification notification;
    notification.name = "alice";
    notifier.notify(notification);

    EXPECT_EQ(out.str(), PrintNotifier::formatBanner(notification) + "\n");
    EXPECT_TRUE(notifier.lastSnapshotPath().empty());
}

TEST(PrintNotifier, StoresSnapshotAsJpeg) {
    TempDir dir;
    std::ostringstream out;
    PrintNotifier notifier(out, dir.path());

    Notification notification;
    notification.name = "alice, bob";
    notification.image = cv::Mat(32, 24, CV_8UC3, cv::Scalar(30, 60, 90));
    notifier.notify(notification);

    const std::string& path = notifier.lastSnapshotPath();
    ASSERT_FALSE(path.empty());
    EXPECT_EQ(path.rfind(dir.path() + "/", 0), 0u);
    EXPECT_NE(path.find("_alice__bob.jpg"), std::string::npos);

    std::ifstream file(path, std::ios::binary);
    ASSERT_TRUE(file.is_open());
    unsigned char soi[2] = {0, 0};
    file.read(reinterpret_cast<char*>(soi), 2);
    EXPECT_EQ(soi[0], 0xFF);
    EXPECT_EQ(soi[1], 0xD8);
}

TEST(JpegEncoderTest, EncodesColorAndGray) {
    JpegEncoder encoder(80);
    std::vector<unsigned char> jpeg;

    ASSERT_TRUE(encoder.encode(cv::Mat(16, 16, CV_8UC3, cv::Scalar(10, 20, 30)), jpeg));
    ASSERT_GT(jpeg.size(), 2u);
    EXPECT_EQ(jpeg[0], 0xFF);
    EXPECT_EQ(jpeg[1], 0xD8);

    ASSERT_TRUE(encoder.encode(cv::Mat(16, 16, CV_8UC1, cv::Scalar(128)), jpeg));
    EXPECT_GT(jpeg.size(), 2u);
}

TEST(JpegEncoderTest, RejectsEmptyImage) {
    JpegEncoder encoder;
    std::vector<unsigned char> jpeg;
    EXPECT_FALSE(encoder.encode(cv::Mat(), jpeg));
}

class MakeNotificationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& config = Config::getInstance();
        config.clear();
        const std::string path = dir_.file("people.conf");
        std::ofstream(path) << "[recognition]\n"
                               "[person:Jane Doe]\n"
                               "position = CTO\n"
                               "company = ACME\n"
                               "[person:bob]\n"
                               "position = CFO\n";
        ASSERT_TRUE(config.load(path));
    }

    void TearDown() override { Config::getInstance().clear(); }

    TempDir dir_;
};

TEST_F(MakeNotificationTest, ReadsPersonSection) {
    Notification known = makeNotification("Jane Doe", {"Jane Doe"}, cv::Mat());
    EXPECT_EQ(known.name, "Jane Doe");
    EXPECT_EQ(known.position, "CTO");
    EXPECT_EQ(known.company, "ACME");
}

TEST_F(MakeNotificationTest, UnknownPersonHasNoMetadata) {
    Notification unknown = makeNotification("Unknown person", {}, cv::Mat());
    EXPECT_EQ(unknown.name, "Unknown person");
    EXPECT_TRUE(unknown.position.empty());
    EXPECT_TRUE(unknown.company.empty());
}

TEST_F(MakeNotificationTest, SeveralPeopleTagEachValue) {
    Notification both = makeNotification("Jane Doe, bob", {"Jane Doe", "bob"}, cv::Mat());
    EXPECT_EQ(both.name, "Jane Doe, bob");
    EXPECT_EQ(both.position, "CTO (Jane Doe), CFO (bob)");
    EXPECT_EQ(both.company, "ACME (Jane Doe)");
}
