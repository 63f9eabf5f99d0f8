#include "version/update_classifier.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace updock {
namespace {

Pattern Compile(const char* s) {
    auto p = PatternCompiler::Compile(s);
    EXPECT_TRUE(p.has_value()) << s;
    return std::move(*p);
}

using Tags = std::vector<std::string>;

TEST(UpdateClassifierTest, BucketsCandidatesAgainstCurrentTag) {
    const auto pattern = Compile("<!>.<>.<>");
    const Tags candidates = {"1.6.12", "1.4.13", "2.4.12", "3.5.13", "1.4.12", "1.4.11"};

    auto set = UpdateClassifier::Classify(pattern, "1.4.12", candidates);
    ASSERT_TRUE(set.has_value()) << set.error().msg;
    EXPECT_EQ(set->breaking, (Tags{"3.5.13", "2.4.12"}));
    EXPECT_EQ(set->compatible, (Tags{"1.6.12", "1.4.13"}));
    EXPECT_EQ(set->unmatched, 0U);
    EXPECT_TRUE(set->HasUpdates());
}

TEST(UpdateClassifierTest, SortsNewestFirstByNumericValue) {
    const auto pattern = Compile("<>.<>");
    const Tags candidates = {"1.9", "1.10", "1.2", "2.0", "1.11"};

    auto set = UpdateClassifier::Classify(pattern, "1.1", candidates);
    ASSERT_TRUE(set.has_value());
    EXPECT_EQ(set->compatible, (Tags{"2.0", "1.11", "1.10", "1.9", "1.2"}));
    EXPECT_TRUE(set->breaking.empty());
}

TEST(UpdateClassifierTest, KeepsFirstTagForEqualVersions) {
    const auto pattern = Compile("<!>.<>");
    const Tags candidates = {"2.01", "2.1", "02.1", "1.5", "1.05"};

    auto set = UpdateClassifier::Classify(pattern, "1.0", candidates);
    ASSERT_TRUE(set.has_value());
    EXPECT_EQ(set->breaking, (Tags{"2.01"}));
    EXPECT_EQ(set->compatible, (Tags{"1.5"}));
}

TEST(UpdateClassifierTest, NonMatchingCandidatesAreOnlyCounted) {
    const auto pattern = Compile("<!>.<>.<>-alpine");
    const Tags clean = {"14.6.0-alpine", "15.0.0-alpine"};
    Tags noisy = {"latest", "14.6.0-alpine", "15.0.0", "lts-alpine", "15.0.0-alpine", "14.6.0a-alpine"};

    auto expected = UpdateClassifier::Classify(pattern, "14.5.0-alpine", clean);
    auto actual = UpdateClassifier::Classify(pattern, "14.5.0-alpine", noisy);
    ASSERT_TRUE(expected.has_value());
    ASSERT_TRUE(actual.has_value());
    EXPECT_EQ(actual->breaking, expected->breaking);
    EXPECT_EQ(actual->compatible, expected->compatible);
    EXPECT_EQ(actual->unmatched, 4U);
    EXPECT_EQ(expected->unmatched, 0U);
}

TEST(UpdateClassifierTest, NoUpdatesWhenNothingIsNewer) {
    const auto pattern = Compile("<>.<>.<>");
    auto set = UpdateClassifier::Classify(pattern, "3.1.4", {"3.1.4", "3.1.3", "2.9.9", "latest"});
    ASSERT_TRUE(set.has_value());
    EXPECT_FALSE(set->HasUpdates());
    EXPECT_EQ(set->unmatched, 1U);
}

TEST(UpdateClassifierTest, CurrentTagMismatchIsFatal) {
    const auto pattern = Compile("<>.<>.<>");
    for (const Tags& candidates : {Tags{}, Tags{"1.2.3", "2.0.0"}}) {
        auto set = UpdateClassifier::Classify(pattern, "1.2", candidates);
        ASSERT_FALSE(set.has_value());
        EXPECT_EQ(set.error().kind, ErrorKind::CurrentTagMismatch);
        EXPECT_NE(set.error().msg.find("'1.2'"), std::string::npos);
        EXPECT_NE(set.error().msg.find("<>.<>.<>"), std::string::npos);
    }
}

TEST(UpdateClassifierTest, EmptyCandidateList) {
    const auto pattern = Compile("<>");
    auto set = UpdateClassifier::Classify(pattern, "7", {});
    ASSERT_TRUE(set.has_value());
    EXPECT_FALSE(set->HasUpdates());
    EXPECT_EQ(set->unmatched, 0U);
}

} // namespace
} // namespace updock
