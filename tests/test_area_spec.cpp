// Copyright 2026 The screenrec Authors
// Tests for: ParseAreaSpec, AreaSpec::ToString

#include <string>

#include "core/area_spec.h"
#include "gtest/gtest.h"

using screenrec::internal::AreaSpec;
using screenrec::internal::Error;
using screenrec::internal::ParseAreaSpec;

// ---------------------------------------------------------------------------
// Accepted forms
// ---------------------------------------------------------------------------

TEST(AreaSpecTest, EmptyMeansFullScreen) {
  AreaSpec spec = AreaSpec::CustomRect(1, 2, 3, 4);
  Error err;
  ASSERT_TRUE(ParseAreaSpec("", &spec, &err));
  EXPECT_EQ(spec.kind, AreaSpec::Kind::kFullScreen);

  ASSERT_TRUE(ParseAreaSpec("   ", &spec, &err));
  EXPECT_EQ(spec.kind, AreaSpec::Kind::kFullScreen);
}

TEST(AreaSpecTest, CustomRect) {
  AreaSpec spec;
  Error err;
  ASSERT_TRUE(ParseAreaSpec("0:0:1280:720", &spec, &err));
  EXPECT_EQ(spec.kind, AreaSpec::Kind::kCustomRect);
  EXPECT_EQ(spec.x, 0);
  EXPECT_EQ(spec.y, 0);
  EXPECT_EQ(spec.width, 1280);
  EXPECT_EQ(spec.height, 720);
}

TEST(AreaSpecTest, CustomRectWithSpaces) {
  AreaSpec spec;
  Error err;
  ASSERT_TRUE(ParseAreaSpec(" 10 : 20 : 30 : 40 ", &spec, &err));
  EXPECT_EQ(spec.x, 10);
  EXPECT_EQ(spec.y, 20);
  EXPECT_EQ(spec.width, 30);
  EXPECT_EQ(spec.height, 40);
}

TEST(AreaSpecTest, NegativeOriginIsLeftToBoundsChecking) {
  AreaSpec spec;
  Error err;
  ASSERT_TRUE(ParseAreaSpec("-10:-5:100:100", &spec, &err));
  EXPECT_EQ(spec.x, -10);
  EXPECT_EQ(spec.y, -5);
}

TEST(AreaSpecTest, Centered) {
  AreaSpec spec;
  Error err;
  ASSERT_TRUE(ParseAreaSpec("center:800:600", &spec, &err));
  EXPECT_EQ(spec.kind, AreaSpec::Kind::kCentered);
  EXPECT_EQ(spec.width, 800);
  EXPECT_EQ(spec.height, 600);
}

TEST(AreaSpecTest, CenterKeywordIsCaseInsensitive) {
  AreaSpec spec;
  Error err;
  ASSERT_TRUE(ParseAreaSpec("Center:640:480", &spec, &err));
  EXPECT_EQ(spec.kind, AreaSpec::Kind::kCentered);
  ASSERT_TRUE(ParseAreaSpec("CENTER:640:480", &spec, &err));
  EXPECT_EQ(spec.kind, AreaSpec::Kind::kCentered);
}

// ---------------------------------------------------------------------------
// Rejected forms
// ---------------------------------------------------------------------------

TEST(AreaSpecTest, MalformedInputIsConfigurationError) {
  const char* bad[] = {"abc",           "1:2:3",          "1:2:3:4:5",
                       "0:0:0:100",     "0:0:100:-1",     "center:0:10",
                       "center:800",    "center:800:abc", "1.5:0:10:10",
                       "99999999999:0:1:1", "middle:800:600", "::::"};
  for (const char* text : bad) {
    AreaSpec spec;
    Error err;
    EXPECT_FALSE(ParseAreaSpec(text, &spec, &err)) << text;
    EXPECT_EQ(err.code, kScreenRecErrorConfiguration) << text;
    EXPECT_FALSE(err.hint.empty()) << text;
  }
}

TEST(AreaSpecTest, NullOutIsInvalidParam) {
  Error err;
  EXPECT_FALSE(ParseAreaSpec("0:0:10:10", nullptr, &err));
  EXPECT_EQ(err.code, kScreenRecErrorInvalidParam);
}

TEST(AreaSpecTest, NullErrorIsAllowed) {
  AreaSpec spec;
  EXPECT_FALSE(ParseAreaSpec("bogus", &spec, nullptr));
}

// ---------------------------------------------------------------------------
// ToString
// ---------------------------------------------------------------------------

TEST(AreaSpecTest, ToString) {
  EXPECT_EQ(AreaSpec::FullScreen().ToString(), "full screen");
  EXPECT_EQ(AreaSpec::CustomRect(1, 2, 3, 4).ToString(), "1:2:3:4");
  EXPECT_EQ(AreaSpec::Centered(800, 600).ToString(), "center:800:600");
}
