// Copyright 2026 The screenrec Authors
// Tests for: GeometryResolver (screen areas, scaling, application matching,
//            window selection)

#include <algorithm>
#include <string>
#include <vector>

#include "core/geometry_resolver.h"
#include "fakes.h"
#include "gtest/gtest.h"

using screenrec::internal::ApplicationDescriptor;
using screenrec::internal::AreaSpec;
using screenrec::internal::CaptureTarget;
using screenrec::internal::Error;
using screenrec::internal::GeometryResolver;
using screenrec::internal::RecordingGeometry;
using screenrec::internal::Rect;
using screenrec::internal::ResolvedTarget;
using screenrec::internal::ScreenDescriptor;
using screenrec::internal::TargetSelector;
using screenrec::internal::WindowDescriptor;
using screenrec::internal::test::FakeEnumeration;
using screenrec::internal::test::MakeScreen;
using screenrec::internal::test::MakeWindow;

namespace {

bool HasWarningContaining(const std::vector<std::string>& warnings,
                          const std::string& needle) {
  for (const auto& w : warnings) {
    if (w.find(needle) != std::string::npos) return true;
  }
  return false;
}

ApplicationDescriptor App(const std::string& id, const std::string& name) {
  ApplicationDescriptor a;
  a.id = id;
  a.name = name;
  a.window_count = 1;
  return a;
}

}  // namespace

// ---------------------------------------------------------------------------
// Screen areas
// ---------------------------------------------------------------------------

TEST(GeometryResolverTest, FullScreen) {
  ScreenDescriptor s = MakeScreen(0, 0, 0, 1920, 1080, 1.0, true);
  RecordingGeometry g;
  Error err;
  ASSERT_TRUE(GeometryResolver::ResolveScreenArea(s, AreaSpec::FullScreen(),
                                                  &g, nullptr, &err));
  EXPECT_EQ(g.pixel_output_size.width, 1920);
  EXPECT_EQ(g.pixel_output_size.height, 1080);
  EXPECT_EQ(g.pixel_source_rect.x, 0);
  EXPECT_EQ(g.pixel_source_rect.y, 0);
  EXPECT_DOUBLE_EQ(g.logical_source_rect.width, 1920);
  EXPECT_DOUBLE_EQ(g.logical_source_rect.height, 1080);
  EXPECT_DOUBLE_EQ(g.scale_factor, 1.0);
}

TEST(GeometryResolverTest, CenteredArea) {
  ScreenDescriptor s = MakeScreen(0, 0, 0, 1920, 1080);
  RecordingGeometry g;
  Error err;
  ASSERT_TRUE(GeometryResolver::ResolveScreenArea(
      s, AreaSpec::Centered(800, 600), &g, nullptr, &err));
  EXPECT_EQ(g.pixel_source_rect.x, 560);
  EXPECT_EQ(g.pixel_source_rect.y, 240);
  EXPECT_EQ(g.pixel_source_rect.width, 800);
  EXPECT_EQ(g.pixel_source_rect.height, 600);
  EXPECT_EQ(g.pixel_output_size.width, 800);
  EXPECT_EQ(g.pixel_output_size.height, 600);
}

TEST(GeometryResolverTest, HiDpiScreenReportsPixelSize) {
  // A 1512x982 logical panel at 2x, as on a 14" laptop.
  ScreenDescriptor s = MakeScreen(0, 0, 0, 1512, 982, 2.0, true);
  EXPECT_EQ(s.pixel_width(), 3024);
  EXPECT_EQ(s.pixel_height(), 1964);

  RecordingGeometry g;
  Error err;
  ASSERT_TRUE(GeometryResolver::ResolveScreenArea(s, AreaSpec::FullScreen(),
                                                  &g, nullptr, &err));
  EXPECT_EQ(g.pixel_output_size.width, 3024);
  EXPECT_EQ(g.pixel_output_size.height, 1964);
  EXPECT_DOUBLE_EQ(g.logical_source_rect.width, 1512);
  EXPECT_DOUBLE_EQ(g.logical_source_rect.height, 982);
  EXPECT_DOUBLE_EQ(g.scale_factor, 2.0);
}

TEST(GeometryResolverTest, CustomAreaIsInPixels) {
  ScreenDescriptor s = MakeScreen(0, 0, 0, 1512, 982, 2.0);
  RecordingGeometry g;
  Error err;
  ASSERT_TRUE(GeometryResolver::ResolveScreenArea(
      s, AreaSpec::CustomRect(100, 50, 800, 600), &g, nullptr, &err));
  EXPECT_EQ(g.pixel_output_size.width, 800);
  EXPECT_EQ(g.pixel_output_size.height, 600);
  EXPECT_DOUBLE_EQ(g.logical_source_rect.x, 50);
  EXPECT_DOUBLE_EQ(g.logical_source_rect.y, 25);
  EXPECT_DOUBLE_EQ(g.logical_source_rect.width, 400);
  EXPECT_DOUBLE_EQ(g.logical_source_rect.height, 300);
}

TEST(GeometryResolverTest, AreaOutOfBounds) {
  ScreenDescriptor s = MakeScreen(0, 0, 0, 1920, 1080);
  RecordingGeometry g;
  Error err;
  EXPECT_FALSE(GeometryResolver::ResolveScreenArea(
      s, AreaSpec::CustomRect(0, 0, 5000, 5000), &g, nullptr, &err));
  EXPECT_EQ(err.code, kScreenRecErrorAreaOutOfBounds);
  EXPECT_NE(err.message.find("1920x1080"), std::string::npos);

  err.Clear();
  EXPECT_FALSE(GeometryResolver::ResolveScreenArea(
      s, AreaSpec::CustomRect(-1, 0, 100, 100), &g, nullptr, &err));
  EXPECT_EQ(err.code, kScreenRecErrorAreaOutOfBounds);

  err.Clear();
  EXPECT_FALSE(GeometryResolver::ResolveScreenArea(
      s, AreaSpec::CustomRect(1821, 0, 100, 100), &g, nullptr, &err));
  EXPECT_EQ(err.code, kScreenRecErrorAreaOutOfBounds);

  err.Clear();
  EXPECT_FALSE(GeometryResolver::ResolveScreenArea(
      s, AreaSpec::Centered(2000, 600), &g, nullptr, &err));
  EXPECT_EQ(err.code, kScreenRecErrorAreaOutOfBounds);
}

// ---------------------------------------------------------------------------
// Area sweeps over panel sizes and scale factors
// ---------------------------------------------------------------------------

namespace {

struct Panel {
  double width;
  double height;
};

const Panel kPanels[] = {{1280, 720}, {1920, 1080}, {2560, 1440}, {1512, 982}};
const double kScales[] = {1.0, 1.5, 2.0};

}  // namespace

TEST(GeometryResolverTest, CenteredAreaSweepIsCentered) {
  for (const Panel& p : kPanels) {
    for (double scale : kScales) {
      ScreenDescriptor s = MakeScreen(0, 0, 0, p.width, p.height, scale);
      for (int w : {1, 101, 640, s.pixel_width() - 1, s.pixel_width()}) {
        const int h = std::min(w, s.pixel_height());
        RecordingGeometry g;
        Error err;
        ASSERT_TRUE(GeometryResolver::ResolveScreenArea(
            s, AreaSpec::Centered(w, h), &g, nullptr, &err))
            << p.width << "x" << p.height << "@" << scale << " " << w;
        const double cx = g.pixel_source_rect.x + w / 2.0;
        const double cy = g.pixel_source_rect.y + h / 2.0;
        EXPECT_NEAR(cx, s.pixel_width() / 2.0, 1.0)
            << p.width << "x" << p.height << "@" << scale << " " << w;
        EXPECT_NEAR(cy, s.pixel_height() / 2.0, 1.0)
            << p.width << "x" << p.height << "@" << scale << " " << w;
        EXPECT_EQ(g.pixel_output_size.width, w);
        EXPECT_EQ(g.pixel_output_size.height, h);
      }
    }
  }
}

TEST(GeometryResolverTest, InBoundsCustomAreaSweepKeepsSize) {
  for (const Panel& p : kPanels) {
    for (double scale : kScales) {
      ScreenDescriptor s = MakeScreen(0, 0, 0, p.width, p.height, scale);
      const int sw = s.pixel_width();
      const int sh = s.pixel_height();
      const int rects[][4] = {{0, 0, sw, sh},
                              {0, 0, 1, 1},
                              {sw - 1, sh - 1, 1, 1},
                              {17, 33, sw / 3, sh / 2},
                              {sw / 2, sh / 2, sw - sw / 2, sh - sh / 2}};
      for (const auto& r : rects) {
        RecordingGeometry g;
        Error err;
        ASSERT_TRUE(GeometryResolver::ResolveScreenArea(
            s, AreaSpec::CustomRect(r[0], r[1], r[2], r[3]), &g, nullptr,
            &err))
            << sw << "x" << sh << " " << r[0] << ":" << r[1] << ":" << r[2]
            << ":" << r[3] << " " << err.message;
        EXPECT_EQ(g.pixel_output_size.width, r[2]) << sw << "x" << sh;
        EXPECT_EQ(g.pixel_output_size.height, r[3]) << sw << "x" << sh;
        EXPECT_DOUBLE_EQ(g.logical_source_rect.width * scale, r[2]);
      }
    }
  }
}

TEST(GeometryResolverTest, OutOfBoundsAreaSweepIsRejected) {
  for (const Panel& p : kPanels) {
    for (double scale : kScales) {
      ScreenDescriptor s = MakeScreen(0, 0, 0, p.width, p.height, scale);
      const int sw = s.pixel_width();
      const int sh = s.pixel_height();
      const int rects[][4] = {{0, 0, sw + 1, sh},
                              {0, 0, sw, sh + 1},
                              {1, 0, sw, sh},
                              {sw, 0, 1, 1},
                              {0, sh, 1, 1},
                              {-1, 0, 10, 10},
                              {0, -1, 10, 10}};
      for (const auto& r : rects) {
        RecordingGeometry g;
        Error err;
        EXPECT_FALSE(GeometryResolver::ResolveScreenArea(
            s, AreaSpec::CustomRect(r[0], r[1], r[2], r[3]), &g, nullptr,
            &err))
            << sw << "x" << sh << " " << r[0] << ":" << r[1];
        EXPECT_EQ(err.code, kScreenRecErrorAreaOutOfBounds)
            << sw << "x" << sh << " " << r[0] << ":" << r[1];
      }
      RecordingGeometry g;
      Error err;
      EXPECT_FALSE(GeometryResolver::ResolveScreenArea(
          s, AreaSpec::Centered(sw + 1, sh), &g, nullptr, &err));
      EXPECT_EQ(err.code, kScreenRecErrorAreaOutOfBounds);
    }
  }
}

TEST(GeometryResolverTest, AreaTouchingEdgesIsAccepted) {
  ScreenDescriptor s = MakeScreen(0, 0, 0, 1920, 1080);
  RecordingGeometry g;
  Error err;
  EXPECT_TRUE(GeometryResolver::ResolveScreenArea(
      s, AreaSpec::CustomRect(1820, 980, 100, 100), &g, nullptr, &err));
}

TEST(GeometryResolverTest, SmallAndLargeAreaWarnings) {
  ScreenDescriptor s = MakeScreen(0, 0, 0, 1920, 1080);
  RecordingGeometry g;
  Error err;

  std::vector<std::string> warnings;
  ASSERT_TRUE(GeometryResolver::ResolveScreenArea(
      s, AreaSpec::CustomRect(0, 0, 50, 50), &g, &warnings, &err));
  EXPECT_TRUE(HasWarningContaining(warnings, "very small"));

  warnings.clear();
  ASSERT_TRUE(GeometryResolver::ResolveScreenArea(
      s, AreaSpec::CustomRect(0, 0, 1900, 1000), &g, &warnings, &err));
  EXPECT_TRUE(HasWarningContaining(warnings, "80%"));

  warnings.clear();
  ASSERT_TRUE(GeometryResolver::ResolveScreenArea(
      s, AreaSpec::Centered(800, 600), &g, &warnings, &err));
  EXPECT_TRUE(warnings.empty());
}

// ---------------------------------------------------------------------------
// Resolve() in screen mode
// ---------------------------------------------------------------------------

class ResolverFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    enumeration_.screens.push_back(MakeScreen(0, 0, 0, 1920, 1080, 1.0, true));
    enumeration_.screens.push_back(MakeScreen(1, 1920, 0, 1440, 900, 2.0));
  }

  FakeEnumeration enumeration_;
};

TEST_F(ResolverFixture, SelectsScreenByIndex) {
  GeometryResolver resolver(&enumeration_);
  ResolvedTarget out;
  Error err;
  ASSERT_TRUE(resolver.Resolve(TargetSelector::Screen(1),
                               AreaSpec::FullScreen(), &out, &err));
  EXPECT_EQ(out.target.kind, CaptureTarget::Kind::kScreen);
  EXPECT_EQ(out.target.screen.index, 1);
  EXPECT_EQ(out.geometry.pixel_output_size.width, 2880);
  EXPECT_EQ(out.geometry.pixel_output_size.height, 1800);
}

TEST_F(ResolverFixture, MissingScreen) {
  GeometryResolver resolver(&enumeration_);
  ResolvedTarget out;
  Error err;
  EXPECT_FALSE(resolver.Resolve(TargetSelector::Screen(2),
                                AreaSpec::FullScreen(), &out, &err));
  EXPECT_EQ(err.code, kScreenRecErrorScreenNotFound);
  EXPECT_NE(err.message.find("Screen 3"), std::string::npos);
  EXPECT_FALSE(err.hint.empty());
}

TEST_F(ResolverFixture, NoScreens) {
  enumeration_.screens.clear();
  GeometryResolver resolver(&enumeration_);
  ResolvedTarget out;
  Error err;
  EXPECT_FALSE(resolver.Resolve(TargetSelector::Screen(0),
                                AreaSpec::FullScreen(), &out, &err));
  EXPECT_EQ(err.code, kScreenRecErrorScreenNotFound);
}

TEST_F(ResolverFixture, EnumerationFailurePropagates) {
  enumeration_.fail_code = kScreenRecErrorDisplayUnavailable;
  GeometryResolver resolver(&enumeration_);
  ResolvedTarget out;
  Error err;
  EXPECT_FALSE(resolver.Resolve(TargetSelector::Screen(0),
                                AreaSpec::FullScreen(), &out, &err));
  EXPECT_EQ(err.code, kScreenRecErrorDisplayUnavailable);
}

TEST_F(ResolverFixture, EachResolveQueriesFreshLayout) {
  GeometryResolver resolver(&enumeration_);
  ResolvedTarget out;
  Error err;
  ASSERT_TRUE(resolver.Resolve(TargetSelector::Screen(0),
                               AreaSpec::FullScreen(), &out, &err));
  enumeration_.screens[0].logical_frame.width = 2560;
  enumeration_.screens[0].logical_frame.height = 1440;
  ASSERT_TRUE(resolver.Resolve(TargetSelector::Screen(0),
                               AreaSpec::FullScreen(), &out, &err));
  EXPECT_EQ(out.geometry.pixel_output_size.width, 2560);
  EXPECT_EQ(enumeration_.list_screens_calls, 2);
}

TEST(GeometryResolverTest, NullEnumerationIsNotInitialized) {
  GeometryResolver resolver(nullptr);
  ResolvedTarget out;
  Error err;
  EXPECT_FALSE(resolver.Resolve(TargetSelector::Screen(0),
                                AreaSpec::FullScreen(), &out, &err));
  EXPECT_EQ(err.code, kScreenRecErrorNotInitialized);
}

// ---------------------------------------------------------------------------
// Application matching
// ---------------------------------------------------------------------------

TEST(GeometryResolverTest, MatchExactNameCaseInsensitive) {
  std::vector<ApplicationDescriptor> apps = {App("Firefox", "firefox"),
                                             App("Code", "code")};
  ApplicationDescriptor out;
  Error err;
  ASSERT_TRUE(GeometryResolver::MatchApplication(apps, "FIREFOX", &out, &err));
  EXPECT_EQ(out.id, "Firefox");
}

TEST(GeometryResolverTest, MatchExactNameBeforeSubstring) {
  std::vector<ApplicationDescriptor> apps = {
      App("Code - Insiders", "code-insiders"), App("Code", "code")};
  ApplicationDescriptor out;
  Error err;
  ASSERT_TRUE(GeometryResolver::MatchApplication(apps, "code", &out, &err));
  EXPECT_EQ(out.name, "code");
}

TEST(GeometryResolverTest, MatchExactId) {
  std::vector<ApplicationDescriptor> apps = {
      App("gnome-terminal-server", "gnome-terminal-"),
      App("org.gnome.Nautilus", "nautilus")};
  ApplicationDescriptor out;
  Error err;
  ASSERT_TRUE(GeometryResolver::MatchApplication(
      apps, "gnome-terminal-server", &out, &err));
  EXPECT_EQ(out.name, "gnome-terminal-");
}

TEST(GeometryResolverTest, MatchUniqueSubstring) {
  std::vector<ApplicationDescriptor> apps = {App("Firefox", "firefox"),
                                             App("Gimp-2.10", "gimp")};
  ApplicationDescriptor out;
  Error err;
  ASSERT_TRUE(GeometryResolver::MatchApplication(apps, "fox", &out, &err));
  EXPECT_EQ(out.id, "Firefox");
}

TEST(GeometryResolverTest, AmbiguousSubstringListsCandidates) {
  std::vector<ApplicationDescriptor> apps = {
      App("Google-chrome", "chrome"), App("Chromium", "chromium"),
      App("Firefox", "firefox")};
  ApplicationDescriptor out;
  Error err;
  EXPECT_FALSE(GeometryResolver::MatchApplication(apps, "chrom", &out, &err));
  EXPECT_EQ(err.code, kScreenRecErrorAmbiguousApplication);
  EXPECT_NE(err.message.find("chrome"), std::string::npos);
  EXPECT_NE(err.message.find("chromium"), std::string::npos);
  EXPECT_EQ(err.message.find("firefox"), std::string::npos);
}

TEST(GeometryResolverTest, UnknownApplication) {
  std::vector<ApplicationDescriptor> apps = {App("Firefox", "firefox")};
  ApplicationDescriptor out;
  Error err;
  EXPECT_FALSE(GeometryResolver::MatchApplication(apps, "safari", &out, &err));
  EXPECT_EQ(err.code, kScreenRecErrorApplicationNotFound);
  EXPECT_FALSE(err.hint.empty());
}

TEST(GeometryResolverTest, EmptyQuery) {
  std::vector<ApplicationDescriptor> apps = {App("Firefox", "firefox")};
  ApplicationDescriptor out;
  Error err;
  EXPECT_FALSE(GeometryResolver::MatchApplication(apps, "", &out, &err));
  EXPECT_EQ(err.code, kScreenRecErrorInvalidParam);
}

// ---------------------------------------------------------------------------
// Window selection
// ---------------------------------------------------------------------------

TEST(GeometryResolverTest, TitledWindowPreferredOverLargerUntitled) {
  std::vector<WindowDescriptor> windows = {
      MakeWindow(1, "App", "", 0, 0, 1600, 1000),
      MakeWindow(2, "App", "Main", 0, 0, 800, 600)};
  WindowDescriptor out;
  ASSERT_TRUE(GeometryResolver::SelectBestWindow(windows, &out));
  EXPECT_EQ(out.window_id, 2u);
}

TEST(GeometryResolverTest, LargestTitledWindowWins) {
  std::vector<WindowDescriptor> windows = {
      MakeWindow(1, "App", "Prefs", 0, 0, 400, 300),
      MakeWindow(2, "App", "Main", 0, 0, 1200, 800),
      MakeWindow(3, "App", "About", 0, 0, 300, 200)};
  WindowDescriptor out;
  ASSERT_TRUE(GeometryResolver::SelectBestWindow(windows, &out));
  EXPECT_EQ(out.window_id, 2u);
}

TEST(GeometryResolverTest, SelectBestWindowEmpty) {
  WindowDescriptor out;
  EXPECT_FALSE(GeometryResolver::SelectBestWindow({}, &out));
}

TEST(GeometryResolverTest, ContainingScreen) {
  std::vector<ScreenDescriptor> screens = {
      MakeScreen(0, 0, 0, 1920, 1080, 1.0, true),
      MakeScreen(1, 1920, 0, 1440, 900, 2.0)};

  const ScreenDescriptor* s = GeometryResolver::ContainingScreen(
      screens, Rect{2000, 100, 400, 300});
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->index, 1);

  // Centre in neither screen falls back to the primary.
  s = GeometryResolver::ContainingScreen(screens, Rect{-5000, -5000, 10, 10});
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->index, 0);

  EXPECT_EQ(GeometryResolver::ContainingScreen({}, Rect{0, 0, 1, 1}),
            nullptr);
}

TEST(GeometryResolverTest, ContainingScreenUsesPixelBounds) {
  // Screen 1 spans logical x [1001, 2000) but rounds to pixels [1502, 3001)
  // at 1.5x, so a centre at logical 2000.4 (pixel 3000.6) is still on it.
  std::vector<ScreenDescriptor> screens = {
      MakeScreen(0, 0, 0, 1000, 800, 1.0, true),
      MakeScreen(1, 1001, 0, 999, 800, 1.5)};
  ASSERT_EQ(screens[1].pixel_bounds().x, 1502);
  ASSERT_EQ(screens[1].pixel_bounds().width, 1499);

  const ScreenDescriptor* s = GeometryResolver::ContainingScreen(
      screens, Rect{1990.4, 90, 20, 20});
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->index, 1);

  // Past the rounded pixel edge the fallback applies.
  s = GeometryResolver::ContainingScreen(screens, Rect{1991.0, 90, 20, 20});
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->index, 0);
}

// ---------------------------------------------------------------------------
// Resolve() in application mode
// ---------------------------------------------------------------------------

class AppResolverFixture : public ResolverFixture {
 protected:
  void SetUp() override {
    ResolverFixture::SetUp();
    enumeration_.windows.push_back(
        MakeWindow(42, "Firefox", "Mozilla Firefox", 2020, 100, 800, 600));
    enumeration_.windows.push_back(
        MakeWindow(43, "Firefox", "", 10, 10, 300, 200));
    enumeration_.AddApp("Firefox", "firefox", 1234);
  }
};

TEST_F(AppResolverFixture, WindowOnScaledScreen) {
  GeometryResolver resolver(&enumeration_);
  ResolvedTarget out;
  Error err;
  ASSERT_TRUE(resolver.Resolve(TargetSelector::Application("firefox"),
                               AreaSpec::FullScreen(), &out, &err));
  EXPECT_EQ(out.target.kind, CaptureTarget::Kind::kWindow);
  EXPECT_EQ(out.target.window.window_id, 42u);
  EXPECT_EQ(out.target.screen.index, 1);
  EXPECT_DOUBLE_EQ(out.geometry.scale_factor, 2.0);
  EXPECT_EQ(out.geometry.pixel_output_size.width, 1600);
  EXPECT_EQ(out.geometry.pixel_output_size.height, 1200);
  EXPECT_EQ(out.geometry.pixel_source_rect.x, 200);
  EXPECT_EQ(out.geometry.pixel_source_rect.y, 200);
  EXPECT_DOUBLE_EQ(out.geometry.logical_source_rect.x, 2020);
  EXPECT_DOUBLE_EQ(out.geometry.logical_source_rect.width, 800);
  EXPECT_TRUE(out.warnings.empty());
}

TEST_F(AppResolverFixture, AreaIsIgnoredWithWarning) {
  GeometryResolver resolver(&enumeration_);
  ResolvedTarget out;
  Error err;
  ASSERT_TRUE(resolver.Resolve(TargetSelector::Application("Firefox"),
                               AreaSpec::Centered(640, 480), &out, &err));
  EXPECT_EQ(out.geometry.pixel_output_size.width, 1600);
  EXPECT_TRUE(HasWarningContaining(out.warnings, "ignored"));
}

TEST_F(AppResolverFixture, OffScreenWindowsWarn) {
  for (auto& w : enumeration_.windows) w.on_screen = false;
  GeometryResolver resolver(&enumeration_);
  ResolvedTarget out;
  Error err;
  ASSERT_TRUE(resolver.Resolve(TargetSelector::Application("firefox"),
                               AreaSpec::FullScreen(), &out, &err));
  EXPECT_TRUE(HasWarningContaining(out.warnings, "off-screen"));
}

TEST_F(AppResolverFixture, ApplicationWithoutWindows) {
  enumeration_.AddApp("Daemon", "daemon", 99);
  GeometryResolver resolver(&enumeration_);
  ResolvedTarget out;
  Error err;
  EXPECT_FALSE(resolver.Resolve(TargetSelector::Application("daemon"),
                                AreaSpec::FullScreen(), &out, &err));
  EXPECT_EQ(err.code, kScreenRecErrorNoWindows);
}

TEST_F(AppResolverFixture, UnknownApplication) {
  GeometryResolver resolver(&enumeration_);
  ResolvedTarget out;
  Error err;
  EXPECT_FALSE(resolver.Resolve(TargetSelector::Application("nonexistent"),
                                AreaSpec::FullScreen(), &out, &err));
  EXPECT_EQ(err.code, kScreenRecErrorApplicationNotFound);
}

TEST(GeometryResolverTest, WindowGeometryIsNotBoundsChecked) {
  ScreenDescriptor s = MakeScreen(0, 0, 0, 1920, 1080);
  WindowDescriptor w = MakeWindow(1, "App", "Big", -100, -50, 2400, 1300);
  RecordingGeometry g = GeometryResolver::ResolveWindowGeometry(w, s);
  EXPECT_EQ(g.pixel_source_rect.x, -100);
  EXPECT_EQ(g.pixel_source_rect.y, -50);
  EXPECT_EQ(g.pixel_output_size.width, 2400);
  EXPECT_EQ(g.pixel_output_size.height, 1300);
}
