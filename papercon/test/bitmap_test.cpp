#include "bitmap.hpp"
#include <gtest/gtest.h>

TEST(Bitmap, WritesOutsideAreClipped){
  Bitmap b(4, 3);
  b.set(-1, 0);
  b.set(4, 0);
  b.fill_rect(-5, -5, 2, 2);
  b.fill_rect(2, 1, 10, 10);
  EXPECT_FALSE(b.get(0, 0));
  EXPECT_TRUE(b.get(3, 2));
  EXPECT_TRUE(b.get(2, 1));
  EXPECT_FALSE(b.get(1, 1));
  EXPECT_FALSE(b.get(99, 99));
}

TEST(Bitmap, RotateMapsCorners){
  Bitmap b(5, 3);
  b.set(0, 0);
  b.set(4, 1);
  Bitmap r = b.rotated_180();
  EXPECT_EQ(r.width(), 5);
  EXPECT_EQ(r.height(), 3);
  EXPECT_TRUE(r.get(4, 2));
  EXPECT_TRUE(r.get(0, 1));
  EXPECT_FALSE(r.get(0, 0));
}

TEST(Bitmap, PackRowsMsbFirstWithPadding){
  Bitmap b(10, 2);
  b.set(0, 0);
  b.set(7, 0);
  b.set(8, 0);
  b.set(9, 1);
  auto bytes = b.pack_rows();
  ASSERT_EQ(b.bytes_per_row(), 2);
  ASSERT_EQ(bytes.size(), 4u);
  EXPECT_EQ(bytes[0], 0x81);
  EXPECT_EQ(bytes[1], 0x80);
  EXPECT_EQ(bytes[2], 0x00);
  EXPECT_EQ(bytes[3], 0x40);
}

TEST(Bitmap, DrawRectIsOutlineOnly){
  Bitmap b(10, 10);
  b.draw_rect(0, 0, 10, 10, 2);
  EXPECT_TRUE(b.get(0, 0));
  EXPECT_TRUE(b.get(1, 5));
  EXPECT_TRUE(b.get(9, 9));
  EXPECT_TRUE(b.get(8, 5));
  EXPECT_FALSE(b.get(2, 2));
  EXPECT_FALSE(b.get(5, 5));
}

TEST(Bitmap, BlitOnlyAddsBlack){
  Bitmap dst(4, 4);
  dst.set(0, 0);
  Bitmap src(2, 2);
  src.set(1, 1);
  dst.blit(src, 1, 1);
  EXPECT_TRUE(dst.get(0, 0));
  EXPECT_TRUE(dst.get(2, 2));
  EXPECT_FALSE(dst.get(1, 1));
}
