#include <gtest/gtest.h>
#include "tiledash/core/Error.hpp"
#include "tiledash/core/Types.hpp"

using namespace tdash;

TEST(KeyTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(keyFromString("Tab"), keys::Tab);
    EXPECT_EQ(keyFromString("tab"), keys::Tab);
    EXPECT_EQ(keyFromString("BackTab"), keys::BackTab);
    EXPECT_EQ(keyFromString("f5"), keys::F5);
    EXPECT_EQ(keyFromString("pgdn"), keys::PageDown);
    EXPECT_EQ(keyFromString("ArrowUp"), keys::ArrowUp);
}

TEST(KeyTest, SingleCharactersAreCaseSensitive) {
    EXPECT_EQ(keyFromString("a"), Key('a'));
    EXPECT_EQ(keyFromString("A"), Key('A'));
    EXPECT_NE(keyFromString("a"), keyFromString("A"));
}

TEST(KeyTest, UnknownNames) {
    EXPECT_FALSE(keyFromString("").has_value());
    EXPECT_FALSE(keyFromString("NotAKey").has_value());
}

TEST(KeyTest, Names) {
    EXPECT_EQ(keyName(keys::Tab), "Tab");
    EXPECT_EQ(keyName(keys::F12), "F12");
    EXPECT_EQ(keyName('x'), "x");
}

TEST(ColorTest, Equality) {
    EXPECT_EQ(Color::number(3), colors::Yellow);
    EXPECT_NE(Color::number(3), Color::rgb(0, 0, 3));
    EXPECT_TRUE(colors::Default.isDefault());
    EXPECT_EQ(Color::rgb(1, 2, 3).toString(), "ColorRGB(1,2,3)");
}

TEST(ErrorTest, ToStringIncludesContainerId) {
    Error error = configurationError("bad value", "menu");
    EXPECT_EQ(error.toString(), "ConfigurationError in container \"menu\": bad value");

    Error anonymous = geometryError("too small");
    EXPECT_EQ(anonymous.toString(), "GeometryError: too small");
}

TEST(ErrorTest, StatusAndResult) {
    Status ok = Status::ok();
    EXPECT_TRUE(ok.isOk());

    Status failed = configurationError("nope");
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "nope");

    Result<int> value = 7;
    ASSERT_TRUE(value.isOk());
    EXPECT_EQ(value.value(), 7);
    EXPECT_TRUE(value.status().isOk());

    Result<int> error = geometryError("broken");
    EXPECT_FALSE(error.isOk());
    EXPECT_EQ(error.status().error().kind, ErrorKind::GeometryError);
}
