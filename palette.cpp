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

#include <algorithm>
#include <unordered_set>
#include "gifanim.h"

// Sets NumBits according to the size of the palette.
void Palette::CalcBits()
{
	int bits = 0;
	while ((size_t)1 << bits < Pal.size())
		bits++;
	NumBits = bits;
}

// Returns a copy of the palette with exactly numcolors entries. GIF color
// tables must be a power of 2 in size, so the writer always asks for 256.
Palette Palette::Pad(size_t numcolors) const
{
	std::vector<ColorRegister> dest(numcolors);
	// The source could potentially have more colors than we need, but also
	// might not have enough. Extras stay black.
	std::copy_n(Pal.begin(), std::min(Pal.size(), numcolors), dest.begin());
	return Palette(std::move(dest));
}

size_t Palette::CountUnique() const
{
	std::unordered_set<uint32_t> seen;
	for (const ColorRegister &reg : Pal)
	{
		seen.insert(reg.red | (reg.green << 8) | (reg.blue << 16));
	}
	return seen.size();
}
