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

#include <random>

#include "gifanim.h"
#include "gifdecode.h"

static std::vector<uint8_t> Compress(const std::vector<uint8_t> &pixels, uint8_t depth = 8)
{
	std::vector<uint8_t> out;
	LZWCompress(out, pixels.data(), pixels.size(), depth);
	return out;
}

static std::vector<uint8_t> Decompress(const std::vector<uint8_t> &stream, size_t *maxblock = nullptr)
{
	size_t consumed = 0;
	std::vector<uint8_t> pixels = LZWDecode(stream.data(), stream.size(), consumed, maxblock);
	EXPECT_EQ(consumed, stream.size());
	return pixels;
}

TEST(LZWTest, SinglePixelExactBytes)
{
	// Clear (256), literal 0, EOI (257), all 9 bits wide.
	std::vector<uint8_t> expected = { 0x08, 0x04, 0x00, 0x01, 0x04, 0x04, 0x00 };
	EXPECT_EQ(Compress({ 0 }), expected);
}

TEST(LZWTest, EmptyInputIsClearAndEOI)
{
	std::vector<uint8_t> expected = { 0x08, 0x03, 0x00, 0x03, 0x02, 0x00 };
	std::vector<uint8_t> stream = Compress({});
	EXPECT_EQ(stream, expected);
	EXPECT_TRUE(Decompress(stream).empty());
}

TEST(LZWTest, MinimumCodeSizeIsAtLeastTwo)
{
	EXPECT_EQ(Compress({ 1, 0, 1 }, 1)[0], 2);
	EXPECT_EQ(Compress({ 1, 0, 1 }, 2)[0], 2);
	EXPECT_EQ(Compress({ 1, 0, 1 }, 5)[0], 5);
	EXPECT_EQ(Compress({ 1, 0, 1 }, 8)[0], 8);
}

TEST(LZWTest, SinglePixelRoundTrip)
{
	for (int value : { 0, 1, 127, 255 })
	{
		std::vector<uint8_t> pixels = { (uint8_t)value };
		EXPECT_EQ(Decompress(Compress(pixels)), pixels) << "value " << value;
	}
}

TEST(LZWTest, UniformInputCompressesWell)
{
	std::vector<uint8_t> pixels(100 * 100, 7);
	std::vector<uint8_t> stream = Compress(pixels);
	EXPECT_LT(stream.size(), 300u);
	EXPECT_EQ(Decompress(stream), pixels);
}

TEST(LZWTest, MillionRandomPixelsRoundTrip)
{
	// Random data fills the 12-bit table many times over, so this also
	// exercises the mid-stream clear codes.
	std::vector<uint8_t> pixels(1 << 20);
	std::mt19937 rng(3);
	for (uint8_t &p : pixels)
	{
		p = (uint8_t)(rng() & 0xFF);
	}
	std::vector<uint8_t> stream = Compress(pixels);
	size_t maxblock = 0;
	EXPECT_EQ(Decompress(stream, &maxblock), pixels);
	EXPECT_EQ(maxblock, 254u);
}

TEST(LZWTest, RampRoundTrip)
{
	std::vector<uint8_t> pixels(300000);
	for (size_t i = 0; i < pixels.size(); ++i)
	{
		pixels[i] = (uint8_t)((i / 7) % 256);
	}
	EXPECT_EQ(Decompress(Compress(pixels)), pixels);
}

TEST(LZWTest, SmallCodeSizeRoundTrip)
{
	std::vector<uint8_t> pixels(200000);
	std::mt19937 rng(11);
	for (uint8_t &p : pixels)
	{
		p = (uint8_t)(rng() & 3);
	}
	std::vector<uint8_t> stream = Compress(pixels, 2);
	EXPECT_EQ(stream[0], 2);
	EXPECT_EQ(Decompress(stream), pixels);
}

TEST(LZWTest, PixelWiderThanCodeSizeThrows)
{
	std::vector<uint8_t> pixels = { 0, 1, 9 };
	EXPECT_THROW(Compress(pixels, 2), std::out_of_range);
}

TEST(LZWTest, BadMinimumCodeSizeThrows)
{
	std::vector<uint8_t> out;
	EXPECT_THROW(CodeStream(1, out), std::out_of_range);
	EXPECT_THROW(CodeStream(9, out), std::out_of_range);
}

TEST(LZWTest, Deterministic)
{
	std::vector<uint8_t> pixels(5000);
	for (size_t i = 0; i < pixels.size(); ++i)
	{
		pixels[i] = (uint8_t)((i * 31) ^ (i >> 3));
	}
	EXPECT_EQ(Compress(pixels), Compress(pixels));
}
