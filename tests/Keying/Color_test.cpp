/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <ChromaKey/Keying/Color.hpp>
#include <ChromaKey/Keying/ConfigurationError.hpp>

using namespace ChromaKey::Keying;

TEST(ColorTest, ParsesHexWithAndWithoutHash)
{
	EXPECT_EQ(Color::parseHex("#00ff00"), (Color{0, 255, 0}));
	EXPECT_EQ(Color::parseHex("1A2b3C"), (Color{0x1a, 0x2b, 0x3c}));
}

TEST(ColorTest, RejectsMalformedHex)
{
	EXPECT_FALSE(Color::parseHex("#0f0"));
	EXPECT_FALSE(Color::parseHex("#00ff0g"));
	EXPECT_FALSE(Color::parseHex(""));
	EXPECT_FALSE(Color::parseHex("#00ff0000"));
	EXPECT_THROW(Color::fromHex("green"), ConfigurationError);
}

TEST(ColorTest, FormatsLowercaseHex)
{
	EXPECT_EQ((Color{0, 255, 0}).toHex(), "#00ff00");
	EXPECT_EQ(Color::fromHex("#ABCDEF").toHex(), "#abcdef");
}

TEST(ColorTest, DefaultKeyColorIsPureGreen)
{
	EXPECT_EQ(kDefaultKeyColor, Color::fromHex("#00FF00"));
}

TEST(ColorTest, NeutralColorsHaveNoChroma)
{
	for (Color c : {Color{0, 0, 0}, Color{128, 128, 128}, Color{255, 255, 255}}) {
		const Chroma chroma = toChroma(c);
		EXPECT_NEAR(chroma.cb, 0.0f, 1e-6f);
		EXPECT_NEAR(chroma.cr, 0.0f, 1e-6f);
	}
}

TEST(ColorTest, ToByteClampsAndRounds)
{
	EXPECT_EQ(toByte(-3.0f), 0);
	EXPECT_EQ(toByte(300.0f), 255);
	EXPECT_EQ(toByte(63.75f), 64);
	EXPECT_EQ(toByte(191.25f), 191);
}
