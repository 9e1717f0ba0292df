#include "font.hpp"
#include <gtest/gtest.h>

TEST(Font, LineHeightsPerStyle){
  EXPECT_EQ(style_metrics(TextStyle::Regular).line_height, 22);
  EXPECT_EQ(style_metrics(TextStyle::Bold).line_height, 22);
  EXPECT_EQ(style_metrics(TextStyle::Semibold).line_height, 22);
  EXPECT_EQ(style_metrics(TextStyle::Medium).line_height, 22);
  EXPECT_EQ(style_metrics(TextStyle::Light).line_height, 19);
  EXPECT_EQ(style_metrics(TextStyle::RegularSmall).line_height, 19);
  EXPECT_EQ(style_metrics(TextStyle::BoldLarge).line_height, 28);
}

TEST(Font, TextWidth){
  EXPECT_EQ(text_width("", TextStyle::Regular), 0);
  EXPECT_EQ(text_width("A", TextStyle::Regular), 10);
  EXPECT_EQ(text_width("AB", TextStyle::Regular), 22);
  // double strike adds one column
  EXPECT_EQ(text_width("AB", TextStyle::Bold), 23);
}

TEST(Font, DrawTextMarksPixelsAndReturnsPen){
  Bitmap b(100, 22);
  int x = draw_text(b, 2, 0, "H", TextStyle::Regular);
  EXPECT_EQ(x, 14);
  int black = 0;
  for (int y = 0; y < 22; ++y)
    for (int xx = 0; xx < 100; ++xx) black += b.get(xx, y);
  EXPECT_GT(black, 0);
  // nothing drawn right of the glyph cell
  for (int y = 0; y < 22; ++y) EXPECT_FALSE(b.get(20, y));
}

TEST(Font, SpaceDrawsNothing){
  Bitmap b(50, 22);
  draw_text(b, 0, 0, "   ", TextStyle::Bold);
  for (int y = 0; y < 22; ++y)
    for (int x = 0; x < 50; ++x) ASSERT_FALSE(b.get(x, y));
}

TEST(Font, WrapByWords){
  // 10 regular glyphs = 118 px
  auto lines = wrap_text("aaaa bbbb cccc", TextStyle::Regular, 118);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "aaaa bbbb");
  EXPECT_EQ(lines[1], "cccc");
}

TEST(Font, WrapBreaksLongWords){
  auto lines = wrap_text("abcdefghijkl", TextStyle::Regular, 58);  // 5 glyphs
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0], "abcde");
  EXPECT_EQ(lines[1], "fghij");
  EXPECT_EQ(lines[2], "kl");
}

TEST(Font, EmptyParagraphIsOneBlankLine){
  auto lines = wrap_text("", TextStyle::Regular, 380);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_TRUE(lines[0].empty());
  EXPECT_EQ(wrap_text("   ", TextStyle::Regular, 380).size(), 1u);
}
