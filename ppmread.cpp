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

#include <ctype.h>
#include <stdio.h>
#include <errno.h>
#include <string.h>
#include <fstream>
#include <limits>
#include <sstream>
#include "gifanim.h"

// Reads one decimal header field, skipping whitespace and # comments.
static bool ReadHeaderInt(std::istream &file, int &val)
{
	for (;;)
	{
		int c = file.peek();
		if (c == '#')
		{
			file.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
		}
		else if (c != EOF && isspace(c))
		{
			file.get();
		}
		else
		{
			break;
		}
	}
	return bool(file >> val);
}

// PAM headers are KEY value lines terminated by ENDHDR.
static bool ReadPAMHeader(const std::string &filename, std::istream &file, int &width, int &height, int &depth, int &maxval)
{
	std::string line;
	while (std::getline(file, line))
	{
		std::istringstream fields(line);
		std::string key;
		if (!(fields >> key) || key[0] == '#')
		{
			continue;
		}
		if (key == "ENDHDR")
		{
			return true;
		}
		else if (key == "WIDTH")
		{
			fields >> width;
		}
		else if (key == "HEIGHT")
		{
			fields >> height;
		}
		else if (key == "DEPTH")
		{
			fields >> depth;
		}
		else if (key == "MAXVAL")
		{
			fields >> maxval;
		}
		else if (key == "TUPLTYPE")
		{
			std::string type;
			fields >> type;
			if (type != "RGB" && type != "RGB_ALPHA")
			{
				fprintf(stderr, "%s: unsupported PAM tuple type %s\n", filename.c_str(), type.c_str());
				return false;
			}
		}
		else
		{
			fprintf(stderr, "%s: unknown PAM header field %s\n", filename.c_str(), key.c_str());
			return false;
		}
		if (fields.fail())
		{
			fprintf(stderr, "%s: bad value for PAM header field %s\n", filename.c_str(), key.c_str());
			return false;
		}
	}
	fprintf(stderr, "%s: PAM header has no ENDHDR\n", filename.c_str());
	return false;
}

bool LoadNetpbm(const std::string &filename, std::istream &file, ChunkyBitmap &out)
{
	char magic[2];
	int width = 0, height = 0, depth = 0, maxval = 0;

	if (!file.read(magic, 2))
	{
		fprintf(stderr, "%s is too short to be an image\n", filename.c_str());
		return false;
	}
	if (magic[0] == 'P' && magic[1] == '6')
	{
		if (!ReadHeaderInt(file, width) || !ReadHeaderInt(file, height) || !ReadHeaderInt(file, maxval))
		{
			fprintf(stderr, "%s: bad PPM header\n", filename.c_str());
			return false;
		}
		// Exactly one whitespace character separates the header from the pixels.
		file.get();
		depth = 3;
	}
	else if (magic[0] == 'P' && magic[1] == '7')
	{
		if (!ReadPAMHeader(filename, file, width, height, depth, maxval))
		{
			return false;
		}
	}
	else
	{
		fprintf(stderr, "%s is not a binary PPM or PAM file\n", filename.c_str());
		return false;
	}

	if (width < 1 || height < 1 || width > 65535 || height > 65535)
	{
		fprintf(stderr, "%s: unsupported size %dx%d\n", filename.c_str(), width, height);
		return false;
	}
	if (maxval != 255)
	{
		fprintf(stderr, "%s: only 8-bit images are supported (maxval %d)\n", filename.c_str(), maxval);
		return false;
	}
	if (depth != 3 && depth != 4)
	{
		fprintf(stderr, "%s: only RGB and RGBA images are supported (depth %d)\n", filename.c_str(), depth);
		return false;
	}

	ChunkyBitmap bitmap(width, height, depth);
	size_t len = (size_t)bitmap.Pitch * bitmap.Height;
	if (!file.read(reinterpret_cast<char *>(bitmap.Pixels), len))
	{
		fprintf(stderr, "Only read %llu of %zu bytes of pixel data in %s\n",
			(unsigned long long)file.gcount(), len, filename.c_str());
		return false;
	}
	out = std::move(bitmap);
	return true;
}

bool LoadNetpbm(const std::string &filename, ChunkyBitmap &out)
{
	std::ifstream file(filename, std::ios_base::in | std::ios_base::binary);
	if (!file.is_open())
	{
		fprintf(stderr, "Could not open %s: %s\n", filename.c_str(), strerror(errno));
		return false;
	}
	return LoadNetpbm(filename, file, out);
}
