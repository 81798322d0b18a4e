#include <gtest/gtest.h>
#include "tiledash/container/Container.hpp"
#include "tiledash/container/TreeValidator.hpp"

using namespace tdash;

TEST(TreeValidatorTest, DuplicateIdsFail) {
    auto result = Container::create({
        splitVertical(Left{{id("same")}}, Right{{id("same")}}),
    });

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().kind, ErrorKind::ConfigurationError);
    EXPECT_EQ(result.error().message, "duplicate container ID \"same\"");
    EXPECT_EQ(result.error().container_id, "same");
}

TEST(TreeValidatorTest, DuplicateIdsAcrossLevelsFail) {
    auto result = Container::create({
        id("x"),
        splitVertical(Left{}, Right{{splitHorizontal(Top{}, Bottom{{id("x")}})}}),
    });

    EXPECT_FALSE(result.isOk());
}

TEST(TreeValidatorTest, EmptyIdsNeverConflict) {
    auto result = Container::create({
        splitVertical(Left{{splitHorizontal(Top{}, Bottom{})}}, Right{}),
    });

    ASSERT_TRUE(result.isOk());
    EXPECT_TRUE(validateTree(*result.value()).isOk());
}

TEST(TreeValidatorTest, PercentAndFixedOnSameContainerFail) {
    auto result = Container::create({
        splitVertical(Left{}, Right{}, {splitPercent(30), splitFixed(10)}),
    });

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().message, "only one of splitFixed(10) and splitPercent(30) is allowed");
}

TEST(TreeValidatorTest, FixedWithDefaultPercentPasses) {
    auto result = Container::create({
        splitVertical(Left{{id("l")}}, Right{{id("r")}}, {splitPercent(50), splitFixed(10)}),
    });

    ASSERT_TRUE(result.isOk()) << result.error().toString();

    // The fixed size decides the split
    auto& root = result.value();
    ASSERT_TRUE(root->resolve(Rect{0, 0, 40, 5}).isOk());
    EXPECT_EQ(root->findById("l")->area()->width, 10);
    EXPECT_EQ(root->findById("r")->area()->width, 30);
}

TEST(TreeValidatorTest, FixedWithDefaultPercentPassesOnUpdate) {
    auto result = Container::create({id("root")});
    ASSERT_TRUE(result.isOk());

    EXPECT_TRUE(result.value()->update("root", {
        splitHorizontal(Top{}, Bottom{}, {splitFixedFromEnd(3), splitPercent(50)}),
    }).isOk());
}

TEST(TreeValidatorTest, ReportsEveryProblemInOnePass) {
    auto result = Container::create({
        id("dup"),
        splitVertical(
            Left{{id("dup")}},
            Right{{id("sized"), splitHorizontal(Top{}, Bottom{}, {splitFixed(1), splitPercentFromEnd(20)})}}),
    });

    ASSERT_FALSE(result.isOk());
    const std::string& message = result.error().message;
    EXPECT_NE(message.find("duplicate container ID \"dup\""), std::string::npos);
    EXPECT_NE(message.find("only one of splitFixed(1) and splitPercent(20) is allowed (in \"sized\")"),
              std::string::npos);
    EXPECT_NE(message.find("; "), std::string::npos);
}

TEST(TreeValidatorTest, ValidTreePasses) {
    auto result = Container::create({
        id("root"),
        splitVertical(
            Left{{id("menu")}},
            Right{{id("body"), splitHorizontal(Top{{id("chart")}}, Bottom{{id("log")}},
                                               {splitPercentFromEnd(30)})}},
            {splitFixed(20)}),
    });

    ASSERT_TRUE(result.isOk());
    EXPECT_TRUE(result.value()->validate().isOk());
}
