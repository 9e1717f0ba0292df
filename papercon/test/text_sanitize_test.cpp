#include "text_sanitize.hpp"
#include <gtest/gtest.h>

TEST(Sanitize, PrintableAsciiUntouched){
  EXPECT_EQ(sanitize_text("Hello, world! 123 ~"), "Hello, world! 123 ~");
  EXPECT_EQ(sanitize_text("a\nb"), "a\nb");
}

TEST(Sanitize, TypographyTransliterated){
  EXPECT_EQ(sanitize_text("\xE2\x80\x9CHi\xE2\x80\x9D"), "\"Hi\"");
  EXPECT_EQ(sanitize_text("it\xE2\x80\x99s"), "it's");
  EXPECT_EQ(sanitize_text("a\xE2\x80\x94" "b"), "a-b");
  EXPECT_EQ(sanitize_text("wait\xE2\x80\xA6"), "wait...");
  EXPECT_EQ(sanitize_text("21\xC2\xB0" "C"), "21oC");
  EXPECT_EQ(sanitize_text("\xE2\x82\xAC" "5"), "EUR5");
  EXPECT_EQ(sanitize_text("\xC2\xA9 2024"), "(c) 2024");
}

TEST(Sanitize, AccentsFolded){
  EXPECT_EQ(sanitize_text("Caf\xC3\xA9"), "Cafe");
  EXPECT_EQ(sanitize_text("\xC3\x9C" "ber"), "Uber");
  EXPECT_EQ(sanitize_text("Stra\xC3\x9F" "e"), "Strasse");
  EXPECT_EQ(sanitize_text("ni\xC3\xB1o"), "nino");
}

TEST(Sanitize, ControlAndUnknownDropped){
  EXPECT_EQ(sanitize_text("a\tb"), "a b");
  EXPECT_EQ(sanitize_text("a\rb"), "ab");
  EXPECT_EQ(sanitize_text("x\x1B@y"), "x@y");
  // CJK and emoji have no substitution
  EXPECT_EQ(sanitize_text("a\xE4\xB8\xAD" "b\xF0\x9F\x98\x80"), "ab");
  EXPECT_EQ(sanitize_text("\xEF\xBB\xBFstart"), "start");
}

TEST(Sanitize, MalformedBytesDropped){
  EXPECT_EQ(sanitize_text("a\xFF" "b"), "ab");
  EXPECT_EQ(sanitize_text("a\xC3"), "a");
}
