/* This file is part of gifanim.
**
** Copyright 2015-2019 - Marisa Heit
**
** gifanim is free software : you can redistribute it and / or modify
** it under the terms of the GNU General Public License as published by
** the Free Software Foundation, either version 2 of the License, or
** (at your option) any later version.
**
** gifanim is distributed in the hope that it will be useful,
** but WITHOUT ANY WARRANTY; without even the implied warranty of
** MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.See the
** GNU General Public License for more details.
**
** You should have received a copy of the GNU General Public License
** along with gifanim. If not, see <http://www.gnu.org/licenses/>.
*/

#include <gtest/gtest.h>

#include <algorithm>
#include <climits>
#include <random>

#include "gifanim.h"

static int Distance(const ColorRegister &c, int r, int g, int b)
{
	return abs(c.red - r) + abs(c.green - g) + abs(c.blue - b);
}

static std::vector<uint8_t> RandomPicture(size_t numpixels, unsigned seed)
{
	std::vector<uint8_t> rgb(numpixels * 3);
	std::mt19937 rng(seed);
	for (uint8_t &c : rgb)
	{
		c = (uint8_t)(rng() & 0xFF);
	}
	return rgb;
}

// 4x4 checkerboard of red and blue.
static std::vector<uint8_t> Checkerboard()
{
	std::vector<uint8_t> rgb;
	for (int y = 0; y < 4; ++y)
	{
		for (int x = 0; x < 4; ++x)
		{
			if ((x + y) & 1)
				rgb.insert(rgb.end(), { 0, 0, 255 });
			else
				rgb.insert(rgb.end(), { 255, 0, 0 });
		}
	}
	return rgb;
}

TEST(NeuQuantTest, RejectsSampleFactorOutOfRange)
{
	std::vector<uint8_t> rgb(3 * 16, 128);
	EXPECT_THROW(NeuQuant(rgb.data(), rgb.size(), 0), std::out_of_range);
	EXPECT_THROW(NeuQuant(rgb.data(), rgb.size(), 31), std::out_of_range);
	EXPECT_NO_THROW(NeuQuant(rgb.data(), rgb.size(), 1));
	EXPECT_NO_THROW(NeuQuant(rgb.data(), rgb.size(), 30));
}

TEST(NeuQuantTest, RejectsPartialPixels)
{
	std::vector<uint8_t> rgb(4, 0);
	EXPECT_THROW(NeuQuant(rgb.data(), rgb.size()), std::invalid_argument);
	EXPECT_THROW(NeuQuant(rgb.data(), 0), std::invalid_argument);
}

TEST(NeuQuantTest, PaletteHas256EntriesSortedByGreen)
{
	std::vector<uint8_t> rgb = RandomPicture(64 * 64, 1);
	NeuQuant quant(rgb.data(), rgb.size());
	Palette pal = quant.GetPalette();
	ASSERT_EQ(pal.size(), 256u);
	EXPECT_EQ(pal.Bits(), 8);
	for (size_t i = 1; i < pal.size(); ++i)
	{
		EXPECT_LE(pal[i - 1].green, pal[i].green) << "slot " << i;
	}
}

TEST(NeuQuantTest, LookupMatchesExhaustiveSearch)
{
	std::vector<uint8_t> rgb = RandomPicture(64 * 64, 1);
	NeuQuant quant(rgb.data(), rgb.size());
	Palette pal = quant.GetPalette();

	std::mt19937 rng(7);
	for (int n = 0; n < 2000; ++n)
	{
		int r = rng() & 0xFF, g = rng() & 0xFF, b = rng() & 0xFF;
		int slot = quant.Lookup(r, g, b);
		ASSERT_GE(slot, 0);
		ASSERT_LT(slot, 256);
		int best = INT_MAX;
		for (size_t i = 0; i < pal.size(); ++i)
		{
			best = std::min(best, Distance(pal[i], r, g, b));
		}
		EXPECT_EQ(Distance(pal[slot], r, g, b), best);
	}
}

TEST(NeuQuantTest, CheckerboardKeepsBothColors)
{
	std::vector<uint8_t> rgb = Checkerboard();
	NeuQuant quant(rgb.data(), rgb.size());
	Palette pal = quant.GetPalette();
	int red = quant.Lookup(255, 0, 0);
	int blue = quant.Lookup(0, 0, 255);
	EXPECT_NE(red, blue);
	EXPECT_EQ(pal[red], ColorRegister(255, 0, 0));
	EXPECT_EQ(pal[blue], ColorRegister(0, 0, 255));
}

TEST(NeuQuantTest, SolidColorIsReproduced)
{
	std::vector<uint8_t> rgb;
	for (int i = 0; i < 4; ++i)
	{
		rgb.insert(rgb.end(), { 255, 0, 0 });
	}
	NeuQuant quant(rgb.data(), rgb.size());
	Palette pal = quant.GetPalette();
	EXPECT_EQ(pal[quant.Lookup(255, 0, 0)], ColorRegister(255, 0, 0));
}

TEST(NeuQuantTest, UniformFrameIsReproduced)
{
	std::vector<uint8_t> rgb;
	for (int i = 0; i < 100 * 100; ++i)
	{
		rgb.insert(rgb.end(), { 40, 120, 200 });
	}
	NeuQuant quant(rgb.data(), rgb.size());
	Palette pal = quant.GetPalette();
	EXPECT_EQ(pal[quant.Lookup(40, 120, 200)], ColorRegister(40, 120, 200));
}

TEST(NeuQuantTest, SmallPicturesVisitEveryPixel)
{
	std::vector<uint8_t> rgb(2 * 2 * 3, 50);
	NeuQuant quant(rgb.data(), rgb.size(), 10);
	EXPECT_EQ(quant.GetSampleFactor(), 10);
	quant.GetPalette();
	EXPECT_EQ(quant.GetSampleFactor(), 1);
	EXPECT_EQ(quant.GetStep(), 3);
}

TEST(NeuQuantTest, StepSkipsPrimesDividingTheLength)
{
	// 1000 pixels = 3000 bytes, not a multiple of 499.
	std::vector<uint8_t> rgb = RandomPicture(1000, 2);
	NeuQuant first(rgb.data(), rgb.size());
	first.GetPalette();
	EXPECT_EQ(first.GetStep(), 3 * 499);

	// 998 pixels = 2994 bytes = 6 * 499.
	rgb = RandomPicture(998, 2);
	NeuQuant second(rgb.data(), rgb.size());
	second.GetPalette();
	EXPECT_EQ(second.GetStep(), 3 * 491);
	EXPECT_EQ(second.GetSampleFactor(), 10);
}

TEST(NeuQuantTest, Deterministic)
{
	std::vector<uint8_t> rgb = RandomPicture(48 * 48, 5);
	NeuQuant a(rgb.data(), rgb.size(), 5);
	NeuQuant b(rgb.data(), rgb.size(), 5);
	EXPECT_EQ(a.GetPalette(), b.GetPalette());
}

TEST(NeuQuantTest, GetPaletteTwiceReturnsSamePalette)
{
	std::vector<uint8_t> rgb = RandomPicture(40 * 40, 6);
	NeuQuant quant(rgb.data(), rgb.size());
	Palette first = quant.GetPalette();
	EXPECT_TRUE(quant.IsTrained());
	EXPECT_EQ(quant.GetPalette(), first);
}
