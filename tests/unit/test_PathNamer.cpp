#include <gtest/gtest.h>
#include "uploads/PathNamer.hpp"

#include <ctime>
#include <set>

using namespace ih::uploads;
using ih::uploads::model::Type;

namespace {

// 2024-05-15 12:00:00 local time
std::time_t fixedTime() {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 4;
    tm.tm_mday = 15;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

const PathNamer::ExistsCheck nothingExists = [](const std::string&) { return false; };

}

class PathNamerTest : public ::testing::Test {
protected:
    PathNamer namer{false, fixedTime};
};

TEST_F(PathNamerTest, BaseDirectoryUsesTypeAndMonth) {
    EXPECT_EQ(PathNamer::baseDirectory(Type::Gallery, fixedTime()), "/uploads/images/gallery/2024-05/");
    EXPECT_EQ(PathNamer::baseDirectory(Type::Cover, fixedTime()), "/uploads/images/cover/2024-05/");
}

TEST_F(PathNamerTest, SimpleNameIsKept) {
    EXPECT_EQ(namer.newSourcePath("cat.png", Type::Gallery, nothingExists), "/uploads/images/gallery/2024-05/cat.png");
}

TEST_F(PathNamerTest, SpacesBecomeDashesAndInnerDotsAreDropped) {
    EXPECT_EQ(PathNamer::cleanFileName("My Holiday.v2.JPG"), "my-holidayv2.JPG");
    EXPECT_EQ(PathNamer::cleanFileName("my.holiday.png"), "myholiday.png");
}

TEST_F(PathNamerTest, ExtensionIsKeptVerbatim) {
    EXPECT_EQ(PathNamer::cleanFileName("diagram.drawio.PNG"), "diagramdrawio.PNG");
}

TEST_F(PathNamerTest, AccentedLettersAreTransliterated) {
    EXPECT_EQ(PathNamer::cleanFileName("Caf\u00e9 cr\u00e8me.png"), "cafe-creme.png");
    EXPECT_EQ(PathNamer::cleanFileName("\u00dcber.png"), "uber.png");
    EXPECT_EQ(PathNamer::cleanFileName("Stra\u00dfe \u0141\u00f3d\u017a.jpg"), "strasse-lodz.jpg");
}

TEST_F(PathNamerTest, LongStemIsCapped) {
    const std::string name = std::string(250, 'a') + ".png";
    const auto cleaned = PathNamer::cleanFileName(name);
    EXPECT_EQ(cleaned, std::string(PathNamer::MAX_STEM_LENGTH, 'a') + ".png");

    const auto path = namer.newSourcePath(name, Type::Gallery, nothingExists);
    EXPECT_EQ(path, "/uploads/images/gallery/2024-05/" + cleaned);
}

TEST_F(PathNamerTest, CappedStemDoesNotEndInDash) {
    // 99 letters, a separator, then more letters: the cut lands right after the dash
    const std::string name = std::string(99, 'b') + " " + std::string(150, 'c') + ".gif";
    EXPECT_EQ(PathNamer::cleanFileName(name), std::string(99, 'b') + ".gif");
}

TEST_F(PathNamerTest, EmptyStemGetsRandomName) {
    const auto cleaned = PathNamer::cleanFileName("!!!.png");
    ASSERT_EQ(cleaned.size(), 14u);
    EXPECT_EQ(cleaned.substr(10), ".png");
}

TEST_F(PathNamerTest, CollisionPrependsThreeCharacters) {
    std::set<std::string> taken = {"/uploads/images/gallery/2024-05/cat.png"};
    unsigned int checks = 0;
    const auto path = namer.newSourcePath("cat.png", Type::Gallery, [&](const std::string& p) {
        ++checks;
        return taken.contains(p);
    });

    EXPECT_EQ(checks, 2u);
    const std::string dir = "/uploads/images/gallery/2024-05/";
    ASSERT_EQ(path.size(), dir.size() + 3 + 7);
    EXPECT_EQ(path.substr(0, dir.size()), dir);
    EXPECT_EQ(path.substr(dir.size() + 3), "cat.png");
}

TEST_F(PathNamerTest, RepeatedCollisionsKeepPrefixing) {
    unsigned int checks = 0;
    const auto path = namer.newSourcePath("cat.png", Type::Gallery, [&](const std::string&) { return ++checks < 3; });
    EXPECT_EQ(checks, 3u);
    EXPECT_EQ(path.size(), std::string("/uploads/images/gallery/2024-05/").size() + 6 + 7);
}

TEST_F(PathNamerTest, ExistsFailurePropagates) {
    EXPECT_THROW((void)namer.newSourcePath("cat.png", Type::Gallery,
                                           [](const std::string&) -> bool { throw std::runtime_error("offline"); }),
                 std::runtime_error);
}

TEST_F(PathNamerTest, SecureModeAddsSixteenCharacterToken) {
    const PathNamer secure(true, fixedTime);
    const auto path = secure.newSourcePath("cat.png", Type::Gallery, nothingExists);
    const std::string dir = "/uploads/images/gallery/2024-05/";
    ASSERT_EQ(path.size(), dir.size() + 16 + 1 + 7);
    EXPECT_EQ(path[dir.size() + 16], '-');
    EXPECT_EQ(path.substr(dir.size() + 17), "cat.png");
}

TEST_F(PathNamerTest, SecureTokensDiffer) {
    const PathNamer secure(true, fixedTime);
    EXPECT_NE(secure.newSourcePath("cat.png", Type::Gallery, nothingExists),
              secure.newSourcePath("cat.png", Type::Gallery, nothingExists));
}
