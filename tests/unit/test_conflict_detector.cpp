#include <gtest/gtest.h>
#include "cogmem/cognitive/conflict_detector.hpp"
#include "test_helpers.hpp"
#include <cstdio>
#include <fstream>

using namespace cogmem;
using cogmem::testutil::kDay0;

namespace {

DerivedView view_of(const std::string& hypothesis, const std::string& user = "alice") {
    return DerivedView::create(user, hypothesis, view_types::Belief, "", "",
                               {"evt_" + hypothesis}, 0.5, kDay0);
}

} // anonymous namespace

class ConflictDetectorTest : public ::testing::Test {
protected:
    ConflictDetector detector;
};

// ==========================================
// Antonym Tests
// ==========================================

TEST_F(ConflictDetectorTest, NegatedLikeConflicts) {
    ViewConflict conflict;
    EXPECT_TRUE(detector.conflicts(view_of("用户喜欢吃辣"), view_of("用户不喜欢吃辣"), &conflict));
    EXPECT_EQ(conflict.kind, "antonym");
    EXPECT_NE(conflict.reason.find("吃辣"), std::string::npos);
}

TEST_F(ConflictDetectorTest, AntonymWordConflicts) {
    EXPECT_TRUE(detector.conflicts(view_of("用户喜欢猫"), view_of("用户讨厌猫")));
    EXPECT_TRUE(detector.conflicts(view_of("user always runs"), view_of("user never runs")));
}

TEST_F(ConflictDetectorTest, DifferentSubjectsDoNotConflict) {
    EXPECT_FALSE(detector.conflicts(view_of("用户喜欢吃辣"), view_of("用户不喜欢喝茶")));
    EXPECT_FALSE(detector.conflicts(view_of("用户喜欢吃辣"), view_of("用户喜欢喝茶")));
}

TEST_F(ConflictDetectorTest, SamePolarityDoesNotConflict) {
    EXPECT_FALSE(detector.conflicts(view_of("用户不喜欢吃辣"), view_of("用户不喜欢吃辣的菜")));
}

// ==========================================
// Category Tests
// ==========================================

TEST_F(ConflictDetectorTest, VegetarianVersusMeat) {
    ViewConflict conflict;
    EXPECT_TRUE(detector.conflicts(view_of("用户喜欢吃肉"), view_of("用户是素食主义者"), &conflict));
    EXPECT_EQ(conflict.kind, "category");
    EXPECT_NE(conflict.reason.find("肉"), std::string::npos);
}

TEST_F(ConflictDetectorTest, NegatedMembershipDoesNotConflict) {
    EXPECT_FALSE(detector.conflicts(view_of("用户不吃肉"), view_of("用户是素食主义者")));
    EXPECT_FALSE(detector.conflicts(view_of("user is vegetarian"), view_of("user does not eat meat")));
    EXPECT_TRUE(detector.conflicts(view_of("user is vegetarian"), view_of("user eats steak")));
}

// ==========================================
// Scope Tests
// ==========================================

TEST_F(ConflictDetectorTest, DifferentContextTagsCoexist) {
    DerivedView weekend = view_of("用户喜欢早起");
    DerivedView weekday = view_of("用户是夜猫子");
    EXPECT_TRUE(detector.conflicts(weekend, weekday));

    weekend.context_tag = "周末";
    weekday.context_tag = "工作日";
    EXPECT_FALSE(detector.conflicts(weekend, weekday));

    weekday.context_tag = "周末";
    EXPECT_TRUE(detector.conflicts(weekend, weekday));
}

TEST_F(ConflictDetectorTest, DifferentUsersNeverConflict) {
    EXPECT_FALSE(detector.conflicts(view_of("用户喜欢吃辣", "alice"), view_of("用户不喜欢吃辣", "bob")));
}

TEST_F(ConflictDetectorTest, FindConflictsOnlyConsidersActiveViews) {
    DerivedView a = view_of("用户喜欢吃肉");
    DerivedView b = view_of("用户是素食主义者");
    DerivedView c = view_of("用户喜欢喝茶");

    auto conflicts = detector.find_conflicts({a, b, c});
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(ConflictDetector::conflicts_for(conflicts, a.view_id),
              std::vector<std::string>{b.view_id});
    EXPECT_TRUE(ConflictDetector::conflicts_for(conflicts, c.view_id).empty());

    b.status = ViewStatus::Rejected;
    EXPECT_TRUE(detector.find_conflicts({a, b, c}).empty());
}

// ==========================================
// Lexicon Tests
// ==========================================

TEST(ConflictLexiconTest, CustomLexiconFromFile) {
    const std::string path = ::testing::TempDir() + "cogmem_lexicon_test.json";
    {
        std::ofstream out(path);
        out << R"({"antonyms": [["hot", "cold"]], "categories": []})";
    }

    ConflictLexicon lexicon = ConflictLexicon::from_json_file(path);
    std::remove(path.c_str());

    ASSERT_EQ(lexicon.antonyms.size(), 1u);
    EXPECT_TRUE(lexicon.categories.empty());
    EXPECT_FALSE(lexicon.negations.empty());

    ConflictDetector detector(lexicon);
    EXPECT_TRUE(detector.conflicts(view_of("user likes hot tea"), view_of("user likes cold tea")));
    EXPECT_FALSE(detector.conflicts(view_of("用户喜欢吃肉"), view_of("用户是素食主义者")));
}

TEST(ConflictLexiconTest, BadFilesThrow) {
    EXPECT_THROW(ConflictLexicon::from_json_file("/nonexistent/lexicon.json"), std::runtime_error);
    EXPECT_THROW(ConflictLexicon::from_json(nlohmann::json::parse(R"({"antonyms": [["only-one"]]})")),
                 std::runtime_error);
}
