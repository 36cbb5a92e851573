#include <gtest/gtest.h>
#include <sstream>
#include "client/virtualized_view.hpp"
#include "store/store_error.hpp"

using namespace docpipe::client;

class VirtualizedViewTest : public ::testing::Test {
protected:
  std::string text;
  std::unique_ptr<VirtualizedView> view;

  void SetUp() override {
    // 100 lines: "line 0" .. "line 99"
    for (int i = 0; i < 100; ++i) {
      text += "line " + std::to_string(i);
      if (i < 99) {
        text += "\n";
      }
    }
    view = std::make_unique<VirtualizedView>(ViewportConfig{20.0, 400.0, 10});
    view->set_source(&text);
  }
};

TEST_F(VirtualizedViewTest, WindowAtTop) {
  const RenderWindow win = view->window();

  EXPECT_EQ(view->line_count(), 100u);
  EXPECT_EQ(win.start_line, 0u);
  EXPECT_EQ(win.end_line, 40u);  // 20 visible plus 2 * 10 buffered
  EXPECT_DOUBLE_EQ(win.offset_y, 0.0);
  EXPECT_DOUBLE_EQ(win.total_height, 2000.0);
}

TEST_F(VirtualizedViewTest, WindowFollowsScroll) {
  view->set_scroll(1000.0);  // first visible line 50
  const RenderWindow win = view->window();

  EXPECT_EQ(win.start_line, 40u);
  EXPECT_EQ(win.end_line, 80u);
  EXPECT_DOUBLE_EQ(win.offset_y, 800.0);
}

TEST_F(VirtualizedViewTest, WindowClampedAtBottom) {
  view->scroll_to_end();
  EXPECT_DOUBLE_EQ(view->scroll_top(), 1600.0);

  const RenderWindow win = view->window();
  EXPECT_EQ(win.start_line, 70u);
  EXPECT_EQ(win.end_line, 100u);
}

TEST_F(VirtualizedViewTest, ScrollIsClamped) {
  view->set_scroll(-50.0);
  EXPECT_DOUBLE_EQ(view->scroll_top(), 0.0);

  view->set_scroll(1e9);
  EXPECT_DOUBLE_EQ(view->scroll_top(), view->max_scroll());

  view->scroll_to_top();
  view->scroll_lines(3);
  EXPECT_DOUBLE_EQ(view->scroll_top(), 60.0);
  view->scroll_lines(-10);
  EXPECT_DOUBLE_EQ(view->scroll_top(), 0.0);
}

TEST_F(VirtualizedViewTest, RenderWritesOnlyWindow) {
  std::ostringstream out;
  view->render(out);

  const std::string rendered = out.str();
  EXPECT_EQ(rendered.rfind("line 0\n", 0), 0u);
  EXPECT_NE(rendered.find("line 39\n"), std::string::npos);
  EXPECT_EQ(rendered.find("line 40\n"), std::string::npos);
  EXPECT_EQ(view->visible_lines().size(), 40u);
}

TEST_F(VirtualizedViewTest, EmptyLinesRenderAsSpace) {
  std::string sparse = "a\n\nb";
  view->set_source(&sparse);

  std::ostringstream out;
  view->render(out);
  EXPECT_EQ(out.str(), "a\n \nb\n");
}

TEST_F(VirtualizedViewTest, GrowingSourceIsPickedUp) {
  std::string growing = "first";
  view->set_source(&growing);
  EXPECT_EQ(view->line_count(), 1u);

  growing += "\nsecond\nthird";
  EXPECT_EQ(view->line_count(), 3u);
  ASSERT_EQ(view->visible_lines().size(), 3u);
  EXPECT_EQ(view->visible_lines()[2], "third");
}

TEST_F(VirtualizedViewTest, ScrollMetricsForLoader) {
  view->set_scroll(300.0);
  const ScrollMetrics metrics = view->scroll_metrics();

  EXPECT_DOUBLE_EQ(metrics.scroll_top, 300.0);
  EXPECT_DOUBLE_EQ(metrics.client_height, 400.0);
  EXPECT_DOUBLE_EQ(metrics.scroll_height, 2000.0);
}

TEST_F(VirtualizedViewTest, NoSourceRendersNothing) {
  view->clear_source();

  std::ostringstream out;
  view->render(out);
  EXPECT_EQ(out.str(), "");
  EXPECT_EQ(view->window().end_line, 0u);
  EXPECT_DOUBLE_EQ(view->max_scroll(), 0.0);
}

TEST(VirtualizedViewConfigTest, RejectsNonPositiveSizes) {
  EXPECT_THROW(VirtualizedView(ViewportConfig{0.0, 400.0, 10}), docpipe::store::InvalidArgumentError);
  EXPECT_THROW(VirtualizedView(ViewportConfig{20.0, -1.0, 10}), docpipe::store::InvalidArgumentError);
}
