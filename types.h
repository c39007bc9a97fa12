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

#pragma once

#include <stdint.h>
#include <stdlib.h>
#include <cstddef>

template <typename T, std::size_t N>
constexpr std::size_t countof(T const (&)[N]) noexcept
{
	return N;
}

// GIF stores every multi-byte field little endian.
#ifdef __APPLE__
#include <libkern/OSByteOrder.h>

inline uint16_t LittleShort(uint16_t x)
{
	return OSSwapHostToLittleInt16(x);
}

#elif defined(__BIG_ENDIAN__)

// Swap 16bit, that is, MSB and LSB byte.
inline uint16_t LittleShort(uint16_t x)
{
	return (uint16_t)((x >> 8) | (x << 8));
}

#else

#define LittleShort(x)		(x)

#endif
