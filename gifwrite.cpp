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

#include <stdio.h>
#include <string.h>
#include <errno.h>
#include "gifanim.h"

static_assert(sizeof(ColorRegister) == 3, "Color tables are written straight from ColorRegister arrays");

// Every frame gets its own 256 color table.
static constexpr int LOCAL_PAL_BITS = 8;
static constexpr size_t LOCAL_PAL_SIZE = 1 << LOCAL_PAL_BITS;

static void Append(std::vector<uint8_t> &out, const void *data, size_t len)
{
	const uint8_t *p = reinterpret_cast<const uint8_t *>(data);
	out.insert(out.end(), p, p + len);
}

GIFWriter::GIFWriter(const GIFOptions &options)
	: Options(options)
{
	if (Options.Width < 1 || Options.Width > 65535 || Options.Height < 1 || Options.Height > 65535)
	{
		throw std::invalid_argument("Width and height must be 1..65535, got " +
			std::to_string(Options.Width) + "x" + std::to_string(Options.Height));
	}
	CheckOptions(Options);
	Options.Quality = ClampQuality(Options.Quality);
}

// Everything but the dimensions, which come from the first frame.
void GIFWriter::CheckOptions(const GIFOptions &options)
{
	if (options.Delay < 0)
	{
		throw std::invalid_argument("Delay must not be negative");
	}
	if (options.Delay > 65535 * 10 + 4)
	{
		throw std::invalid_argument("Delay must be at most 655.35 seconds");
	}
	if (options.Repeat < -1 || options.Repeat > 65535)
	{
		throw std::invalid_argument("Repeat must be -1 (no loop), 0 (forever) or 1..65535");
	}
}

int GIFWriter::ClampQuality(int quality)
{
	return quality < MIN_QUALITY ? MIN_QUALITY : quality > MAX_QUALITY ? MAX_QUALITY : quality;
}

void GIFWriter::AddFrame(ChunkyBitmap &&frame)
{
	if (Finished)
	{
		throw std::logic_error("Cannot add frames after encoding");
	}
	if (frame.IsEmpty() || (frame.BytesPerPixel != 3 && frame.BytesPerPixel != 4))
	{
		throw std::invalid_argument("Frame must be an RGB or RGBA bitmap");
	}
	if (frame.Width != Options.Width || frame.Height != Options.Height)
	{
		throw std::invalid_argument("Frame is " + std::to_string(frame.Width) + "x" + std::to_string(frame.Height) +
			" but the animation is " + std::to_string(Options.Width) + "x" + std::to_string(Options.Height));
	}
	Frames.push_back(std::move(frame));
}

void GIFWriter::AddFrame(const uint8_t *pixels, size_t len, int bpp)
{
	if (bpp != 3 && bpp != 4)
	{
		throw std::invalid_argument("Frame must be an RGB or RGBA bitmap");
	}
	const size_t expected = (size_t)Options.Width * Options.Height * bpp;
	if (pixels == nullptr || len != expected)
	{
		throw std::invalid_argument("Frame needs " + std::to_string(expected) + " bytes of pixel data, got " +
			(pixels == nullptr ? std::string("none") : std::to_string(len)));
	}
	AddFrame(ChunkyBitmap(Options.Width, Options.Height, bpp, pixels));
}

std::vector<uint8_t> GIFWriter::Encode(const ProgressFunc &progress)
{
	if (Finished)
	{
		throw std::logic_error("Encode may only be called once");
	}
	if (Frames.empty())
	{
		throw NoFramesError();
	}
	// Frames are released as they are written, so even a failed encode
	// cannot be retried.
	Finished = true;

	std::vector<uint8_t> out;
	const size_t numframes = Frames.size();
	WriteHeader(out);
	for (size_t i = 0; i < numframes; ++i)
	{
		GIFFrame frame = MakeFrame(Frames[i]);
		frame.Write(out);
		Frames[i].Clear();
		if (Options.Verbose)
		{
			fprintf(stderr, "frame %zu/%zu: %zu colors, %zu bytes of image data\n",
				i + 1, numframes, frame.LocalPalette.CountUnique(), frame.LZW.size());
		}
		if (progress)
		{
			progress((int)(((i + 1) * 200 + numframes) / (2 * numframes)));
		}
	}
	// The 0x3B is a trailer byte to terminate the GIF.
	out.push_back(0x3B);
	Frames.clear();
	return out;
}

void GIFWriter::WriteHeader(std::vector<uint8_t> &out) const
{
	// Global color table flag, 8 bits of color resolution, 256 entry table.
	LogicalScreenDescriptor lsd = {
		LittleShort((uint16_t)Options.Width), LittleShort((uint16_t)Options.Height),
		0xF0 | (LOCAL_PAL_BITS - 1), 0, 0 };

	Append(out, "GIF89a", 6);
	Append(out, &lsd, 7);
	// The global color table is only a placeholder. Each frame has its own.
	out.insert(out.end(), LOCAL_PAL_SIZE * 3, 0);

	// Write (or skip) the looping extension
	if (Options.Repeat >= 0)
	{
		static const char netscape[] = "\x21\xFF\x0BNETSCAPE2.0\x03\x01";
		uint16_t loops = LittleShort((uint16_t)Options.Repeat);
		Append(out, netscape, sizeof(netscape) - 1);
		Append(out, &loops, 2);
		out.push_back(0);
	}
}

GIFFrame GIFWriter::MakeFrame(const ChunkyBitmap &chunky) const
{
	GIFFrame newframe;
	std::vector<uint8_t> rgb = chunky.ToRGB();
	NeuQuant quant(rgb.data(), rgb.size(), Options.Quality, Options.Verbose);

	newframe.LocalPalette = quant.GetPalette().Pad(LOCAL_PAL_SIZE);
	if (Options.Verbose)
	{
		fprintf(stderr, "sample factor %d, sampling every %d bytes\n", quant.GetSampleFactor(), quant.GetStep());
	}
	newframe.SetDelay(DelayToCentisecs(Options.Delay));
	newframe.IMD.Width = LittleShort((uint16_t)chunky.Width);
	newframe.IMD.Height = LittleShort((uint16_t)chunky.Height);

	ChunkyBitmap indexed = chunky.RGBtoPalette(quant);
	LZWCompress(newframe.LZW, indexed.Pixels, indexed.NumPixels(), LOCAL_PAL_BITS);
	return newframe;
}

GIFFrame::GIFFrame()
{
	GCE.ExtensionIntroducer = 0x21;
	GCE.GraphicControlLabel = 0xF9;
	GCE.BlockSize = 4;
	GCE.Flags = 0;			// No disposal method, no transparency
	GCE.DelayTime = 0;
	GCE.TransparentColor = 0;
	GCE.BlockTerminator = 0;

	IMD.Left = 0;
	IMD.Top = 0;
	IMD.Width = 0;
	IMD.Height = 0;
	IMD.Flags = 0;
}

void GIFFrame::Write(std::vector<uint8_t> &out) const
{
	ImageDescriptor imd = IMD;
	int localpalbits = LocalPalette.Bits();
	if (localpalbits > 0)
	{
		imd.Flags = 0x80 | (localpalbits - 1);	// Set Local Color Table Flag
	}
	Append(out, &GCE, 8);
	out.push_back(0x2C);	// Image Separator
	Append(out, &imd, 9);
	if (localpalbits > 0)
	{
		Append(out, &LocalPalette[0], 3 * LocalPalette.size());
	}
	out.insert(out.end(), LZW.begin(), LZW.end());
}

bool SaveGIF(const std::string &filename, const std::vector<uint8_t> &data)
{
	FILE *file = fopen(filename.c_str(), "wb");
	if (file == nullptr)
	{
		fprintf(stderr, "Could not open %s: %s\n", filename.c_str(), strerror(errno));
		return false;
	}
	if (fwrite(data.data(), 1, data.size(), file) != data.size())
	{
		fprintf(stderr, "Could not write to %s: %s\n", filename.c_str(), strerror(errno));
		fclose(file);
		return false;
	}
	if (fclose(file) != 0)
	{
		fprintf(stderr, "Could not write to %s: %s\n", filename.c_str(), strerror(errno));
		return false;
	}
	return true;
}
