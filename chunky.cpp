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

#include <string.h>
#include "gifanim.h"

ChunkyBitmap::ChunkyBitmap(int w, int h, int bpp)
{
	Alloc(w, h, bpp);
}

ChunkyBitmap::ChunkyBitmap(int w, int h, int bpp, const uint8_t *pixels)
{
	Alloc(w, h, bpp);
	memcpy(Pixels, pixels, (size_t)Pitch * Height);
}

void ChunkyBitmap::Alloc(int w, int h, int bpp)
{
	if (w <= 0 || h <= 0)
	{
		throw std::invalid_argument("Bitmap dimensions must be positive");
	}
	if (bpp != 1 && bpp != 3 && bpp != 4)
	{
		throw std::invalid_argument("Bytes per pixel must be 1, 3 or 4");
	}
	Width = w;
	Height = h;
	BytesPerPixel = bpp;
	Pitch = Width * BytesPerPixel;
	Pixels = new uint8_t[(size_t)Pitch * Height];
}

ChunkyBitmap::~ChunkyBitmap()
{
	if (Pixels != nullptr)
	{
		delete[] Pixels;
	}
}

ChunkyBitmap::ChunkyBitmap(const ChunkyBitmap &o)
	: Width(o.Width), Height(o.Height), Pitch(o.Pitch),
	  BytesPerPixel(o.BytesPerPixel)
{
	if (o.Pixels != nullptr)
	{
		Pixels = new uint8_t[(size_t)Pitch * Height];
		memcpy(Pixels, o.Pixels, (size_t)Pitch * Height);
	}
}

ChunkyBitmap::ChunkyBitmap(ChunkyBitmap &&o) noexcept
	: Width(o.Width), Height(o.Height), Pitch(o.Pitch),
	  BytesPerPixel(o.BytesPerPixel), Pixels(o.Pixels)
{
	o.Clear(false);
}

ChunkyBitmap &ChunkyBitmap::operator=(ChunkyBitmap &&o) noexcept
{
	if (&o != this)
	{
		if (Pixels != nullptr)
		{
			delete[] Pixels;
		}
		Width = o.Width;
		Height = o.Height;
		Pitch = o.Pitch;
		Pixels = o.Pixels;
		BytesPerPixel = o.BytesPerPixel;
		o.Clear(false);
	}
	return *this;
}

bool ChunkyBitmap::operator==(const ChunkyBitmap &o) const noexcept
{
	if (&o == this) return true;
	if (IsEmpty() || o.IsEmpty()) return IsEmpty() == o.IsEmpty();
	return Width == o.Width
		&& Height == o.Height
		&& Pitch == o.Pitch
		&& BytesPerPixel == o.BytesPerPixel
		&& 0 == memcmp(Pixels, o.Pixels, (size_t)Pitch * Height);
}

// If release is false, the pixel buffer has been taken over by someone else.
void ChunkyBitmap::Clear(bool release) noexcept
{
	if (release && Pixels != nullptr)
	{
		delete[] Pixels;
	}
	Pixels = nullptr;
	Width = 0;
	Height = 0;
	Pitch = 0;
	BytesPerPixel = 0;
}

void ChunkyBitmap::SetSolidColor(int r, int g, int b) noexcept
{
	if (Pixels == nullptr)
	{
		return;
	}
	if (BytesPerPixel == 1)
	{
		memset(Pixels, r, (size_t)Pitch * Height);
		return;
	}
	uint8_t *p = Pixels;
	for (size_t i = NumPixels(); i > 0; --i, p += BytesPerPixel)
	{
		p[0] = r;
		p[1] = g;
		p[2] = b;
		if (BytesPerPixel == 4)
		{
			p[3] = 255;
		}
	}
}

std::vector<uint8_t> ChunkyBitmap::ToRGB() const
{
	std::vector<uint8_t> rgb(NumPixels() * 3);
	if (BytesPerPixel == 3)
	{
		memcpy(rgb.data(), Pixels, rgb.size());
	}
	else if (BytesPerPixel == 4)
	{
		const uint8_t *src = Pixels;
		uint8_t *dest = rgb.data();
		for (size_t i = NumPixels(); i > 0; --i, src += 4, dest += 3)
		{
			dest[0] = src[0];
			dest[1] = src[1];
			dest[2] = src[2];
		}
	}
	else
	{
		throw std::logic_error("ToRGB needs an RGB or RGBA bitmap");
	}
	return rgb;
}

ChunkyBitmap ChunkyBitmap::RGBtoPalette(const NeuQuant &quant) const
{
	if (BytesPerPixel != 3 && BytesPerPixel != 4)
	{
		throw std::logic_error("RGBtoPalette needs an RGB or RGBA bitmap");
	}
	if (!quant.IsTrained())
	{
		throw std::logic_error("RGBtoPalette called before the palette was built");
	}
	ChunkyBitmap out(Width, Height, 1);
	const uint8_t *src = Pixels;
	uint8_t *dest = out.Pixels;
	for (int y = 0; y < Height; ++y)
	{
		const uint8_t *in = src;
		for (int x = 0; x < Width; ++x, in += BytesPerPixel)
		{
			dest[x] = (uint8_t)quant.Lookup(in[0], in[1], in[2]);
		}
		src += Pitch;
		dest += out.Pitch;
	}
	return out;
}
