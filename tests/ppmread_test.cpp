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

#include <sstream>

#include "gifanim.h"

static std::istringstream Stream(const std::string &header, const std::vector<uint8_t> &pixels)
{
	std::string data = header;
	data.append(pixels.begin(), pixels.end());
	return std::istringstream(data, std::ios_base::in | std::ios_base::binary);
}

TEST(NetpbmTest, ReadsPPMWithComment)
{
	std::vector<uint8_t> pixels = { 255, 0, 0, 0, 255, 0, 0, 0, 255, 10, 20, 30 };
	std::istringstream file = Stream("P6\n# made by hand\n2 2\n255\n", pixels);
	ChunkyBitmap bitmap;
	ASSERT_TRUE(LoadNetpbm("test.ppm", file, bitmap));
	EXPECT_EQ(bitmap.Width, 2);
	EXPECT_EQ(bitmap.Height, 2);
	EXPECT_EQ(bitmap.BytesPerPixel, 3);
	EXPECT_EQ(std::vector<uint8_t>(bitmap.Pixels, bitmap.Pixels + 12), pixels);
}

TEST(NetpbmTest, ReadsPAMWithAlpha)
{
	std::vector<uint8_t> pixels = { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12 };
	std::istringstream file = Stream(
		"P7\nWIDTH 3\nHEIGHT 1\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n", pixels);
	ChunkyBitmap bitmap;
	ASSERT_TRUE(LoadNetpbm("test.pam", file, bitmap));
	EXPECT_EQ(bitmap.Width, 3);
	EXPECT_EQ(bitmap.Height, 1);
	EXPECT_EQ(bitmap.BytesPerPixel, 4);
	EXPECT_EQ(bitmap.ToRGB(), (std::vector<uint8_t>{ 1, 2, 3, 5, 6, 7, 9, 10, 11 }));
}

TEST(NetpbmTest, RejectsOtherFormats)
{
	ChunkyBitmap bitmap;
	std::istringstream ascii = Stream("P3\n1 1\n255\n0 0 0\n", {});
	EXPECT_FALSE(LoadNetpbm("ascii.ppm", ascii, bitmap));
	std::istringstream gray = Stream("P7\nWIDTH 1\nHEIGHT 1\nDEPTH 1\nMAXVAL 255\nTUPLTYPE GRAYSCALE\nENDHDR\n", { 0 });
	EXPECT_FALSE(LoadNetpbm("gray.pam", gray, bitmap));
	std::istringstream deep = Stream("P6 1 1 65535\n", { 0, 0, 0, 0, 0, 0 });
	EXPECT_FALSE(LoadNetpbm("deep.ppm", deep, bitmap));
	std::istringstream empty = Stream("", {});
	EXPECT_FALSE(LoadNetpbm("empty.ppm", empty, bitmap));
	EXPECT_TRUE(bitmap.IsEmpty());
}

TEST(NetpbmTest, RejectsTruncatedPixels)
{
	ChunkyBitmap bitmap;
	std::istringstream file = Stream("P6\n2 2\n255\n", { 1, 2, 3 });
	EXPECT_FALSE(LoadNetpbm("short.ppm", file, bitmap));
	EXPECT_TRUE(bitmap.IsEmpty());
}

TEST(NetpbmTest, MissingFileFails)
{
	ChunkyBitmap bitmap;
	EXPECT_FALSE(LoadNetpbm("/nonexistent/frame0001.ppm", bitmap));
}
