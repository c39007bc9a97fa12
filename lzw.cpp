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
#include <iterator>
#include "gifanim.h"

void LZWCompress(std::vector<uint8_t> &vec, const uint8_t *pixels, size_t count, uint8_t colordepth)
{
	uint8_t mincodesize = std::max<uint8_t>(2, colordepth);
	vec.push_back(mincodesize);
	CodeStream codes(mincodesize, vec);
	codes.Compress(pixels, count);
}

CodeStream::CodeStream(uint8_t mincodesize, std::vector<uint8_t> &codes)
	: Codes(codes)
{
	if (mincodesize < 2 || mincodesize > 8)
	{
		throw std::out_of_range("Minimum code size must be 2..8");
	}
	InitBits = mincodesize + 1;
	CodeSize = InitBits;
	MaxCode = (1 << CodeSize) - 1;
	ClearCode = 1 << mincodesize;
	EOICode = ClearCode + 1;
	NextCode = ClearCode + 2;
	Chunk[0] = 0;

	// Primary hash is (pixel << HShift) ^ code. For HSIZE 5003 this gives a
	// shift of 4, which keeps every 8-bit pixel and 12-bit code inside the table.
	HShift = 0;
	for (int fcode = HSIZE; fcode < 65536; fcode *= 2)
	{
		++HShift;
	}
	HShift = 8 - HShift;
}

void CodeStream::Compress(const uint8_t *pixels, size_t count)
{
	ClearHash();
	WriteCode(ClearCode);
	if (count > 0)
	{
		int ent = pixels[0];	// code of string matched so far
		if (ent >= ClearCode)
		{
			throw std::out_of_range("Pixel value does not fit the code size");
		}
		for (size_t n = 1; n < count; ++n)
		{
			int c = pixels[n];
			if (c >= ClearCode)
			{
				throw std::out_of_range("Pixel value does not fit the code size");
			}
			int32_t fcode = (c << CODE_BITS) + ent;
			int i = (c << HShift) ^ ent;

			if (HashTab[i] == fcode)
			{ // ent..c is in the dictionary, so continue matching it.
				ent = CodeTab[i];
				continue;
			}
			if (HashTab[i] >= 0)
			{ // Collision, so probe with a secondary displacement.
				int disp = (i == 0) ? 1 : HSIZE - i;
				bool found = false;
				do
				{
					if ((i -= disp) < 0)
					{
						i += HSIZE;
					}
					if (HashTab[i] == fcode)
					{
						found = true;
						break;
					}
				} while (HashTab[i] >= 0);
				if (found)
				{
					ent = CodeTab[i];
					continue;
				}
			}
			// Not in the dictionary, so write out the matched code and add this
			// new string in the empty slot the probe stopped at.
			WriteCode(ent);
			ent = c;
			if (NextCode < CODE_LIMIT)
			{
				CodeTab[i] = (uint16_t)NextCode++;
				HashTab[i] = fcode;
			}
			else
			{ // Table is full. Start over.
				ClearHash();
				NextCode = ClearCode + 2;
				ClearPending = true;
				WriteCode(ClearCode);
			}
		}
		WriteCode(ent);
	}
	WriteCode(EOICode);
	// Write block terminator
	Codes.push_back(0);
}

void CodeStream::ClearHash()
{
	std::fill(std::begin(HashTab), std::end(HashTab), -1);
}

void CodeStream::WriteCode(int code)
{
	if (code < 0 || code >= CODE_LIMIT)
	{
		throw std::logic_error("LZW code exceeds 12 bits");
	}
	Accum &= (1u << BitPos) - 1;
	Accum |= (uint32_t)code << BitPos;
	BitPos += CodeSize;
	while (BitPos >= 8)
	{
		AddChar(Accum & 0xFF);
		Accum >>= 8;
		BitPos -= 8;
	}

	// If the next entry is going to be too big for the code size,
	// then increase it, if possible.
	if (NextCode > MaxCode || ClearPending)
	{
		if (ClearPending)
		{
			CodeSize = InitBits;
			MaxCode = (1 << CodeSize) - 1;
			ClearPending = false;
		}
		else
		{
			++CodeSize;
			MaxCode = CodeSize == CODE_BITS ? CODE_LIMIT : (1 << CodeSize) - 1;
		}
	}

	if (code == EOICode)
	{ // At EOF, write the rest of the buffer.
		while (BitPos > 0)
		{
			AddChar(Accum & 0xFF);
			Accum >>= 8;
			BitPos -= 8;
		}
		BitPos = 0;
		Dump();
	}
}

void CodeStream::AddChar(uint8_t c)
{
	Chunk[1 + Chunk[0]] = c;
	if (++Chunk[0] >= MAX_CHUNK)
	{
		Dump();
	}
}

void CodeStream::Dump()
{
	if (Chunk[0] > 0)
	{
		Codes.insert(Codes.end(), Chunk, Chunk + Chunk[0] + 1);
		Chunk[0] = 0;
	}
}
