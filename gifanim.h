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

#include <vector>
#include <string>
#include <iosfwd>
#include <functional>
#include <stdexcept>
#include "types.h"

struct ColorRegister {				/* size = 3 bytes			*/
	uint8_t red, green, blue;		/* color intensities 0..255 */
	ColorRegister() : red(0), green(0), blue(0) {}
	ColorRegister(int r, int g, int b) : red(r), green(g), blue(b) {}

	bool operator==(const ColorRegister &b) const noexcept
	{
		return red == b.red && green == b.green && blue == b.blue;
	}
	bool operator!=(const ColorRegister &b) const noexcept { return !(*this == b); }
};

class Palette
{
public:
	Palette() {}
	Palette(std::vector<ColorRegister> &&colors) : Pal(std::move(colors)) { CalcBits(); }
	Palette(const std::vector<ColorRegister> &colors) : Pal(colors) { CalcBits(); }
	ColorRegister &operator[](size_t i) { return Pal[i]; }
	const ColorRegister &operator[](size_t i) const { return Pal[i]; }
	bool operator!=(const Palette &o) const { return Pal != o.Pal; }
	bool operator==(const Palette &o) const { return Pal == o.Pal; }
	size_t size() const { return Pal.size(); }
	bool empty() const { return Pal.empty(); }
	int Bits() const { return NumBits; }

	// Return a palette of exactly numcolors entries, truncated or padded with black.
	Palette Pad(size_t numcolors) const;

	// Number of distinct colors in the palette.
	size_t CountUnique() const;

private:
	std::vector<ColorRegister> Pal;
	int NumBits = 0;	// # of bits needed to represent the maximum value in this palette

	void CalcBits();
};

class NeuQuant;

// A frame of pixels. BytesPerPixel is 3 for RGB, 4 for RGBA (alpha is carried
// but never used for color) and 1 for palette indices.
class ChunkyBitmap
{
public:
	int Width = 0, Height = 0, Pitch = 0, BytesPerPixel = 0;
	uint8_t *Pixels = nullptr;

	ChunkyBitmap() {}
	ChunkyBitmap(int w, int h, int bpp = 1);
	ChunkyBitmap(int w, int h, int bpp, const uint8_t *pixels);
	ChunkyBitmap(const ChunkyBitmap &o);
	ChunkyBitmap(ChunkyBitmap &&o) noexcept;
	ChunkyBitmap &operator=(ChunkyBitmap &&o) noexcept;
	~ChunkyBitmap();

	bool operator==(const ChunkyBitmap &o) const noexcept;
	bool IsEmpty() const noexcept { return Pixels == nullptr; }
	size_t NumPixels() const noexcept { return (size_t)Width * Height; }
	void Clear(bool release=true) noexcept;
	void SetSolidColor(int r, int g, int b) noexcept;

	// Pack the color channels into a tightly packed RGB buffer, dropping alpha.
	std::vector<uint8_t> ToRGB() const;

	// Reduce an RGB(A) image to 8-bit palette indices
	ChunkyBitmap RGBtoPalette(const NeuQuant &quant) const;

private:
	// Allocate the buffer
	void Alloc(int w, int h, int bpp);
};

// NEUQUANT Neural-Net quantization algorithm by Anthony Dekker, 1994.
// Each instance owns its whole network and is used for a single frame.
class NeuQuant
{
public:
	enum { NETSIZE = 256 };

	NeuQuant(const uint8_t *rgb, size_t lengthcount, int samplefac = 10, bool verbose = false);

	// Trains the network and returns the palette in lookup order.
	Palette GetPalette();

	// Returns the palette slot closest to (r,g,b). Only valid after GetPalette.
	int Lookup(int r, int g, int b) const;
	int Lookup(const ColorRegister &c) const { return Lookup(c.red, c.green, c.blue); }

	int GetSampleFactor() const { return samplefac; }
	int GetStep() const { return step; }
	bool IsTrained() const { return trained; }

private:
	int network[NETSIZE][4];	// the network itself, channels in r,g,b order
	int netindex[256];			// for network lookup - really 256
	int bias[NETSIZE];			// bias and freq arrays for learning
	int freq[NETSIZE];
	int radpower[NETSIZE >> 3];	// radpower for precomputation

	const uint8_t *thepicture;
	size_t lengthcount;
	int samplefac;
	int step = 0;
	bool verbose;
	bool trained = false;

	void learn();
	void unbias();
	void inxbuild();
	void calcradpower(int alpha, int rad);
	int contest(int r, int g, int b);
	void altersingle(int alpha, int i, int r, int g, int b);
	void alterneigh(int rad, int i, int r, int g, int b);
};

// GIF restricts codes to 12 bits max
#define CODE_BITS 12
#define CODE_LIMIT (1 << CODE_BITS)

// LZW encoder for GIF image data. Appends the minimum code size byte, the
// code stream in length-prefixed sub-blocks, and the zero block terminator.
class CodeStream
{
public:
	CodeStream(uint8_t mincodesize, std::vector<uint8_t> &codes);

	void Compress(const uint8_t *pixels, size_t count);

private:
	enum { HSIZE = 5003 };			// 80% occupancy
	enum { MAX_CHUNK = 254 };		// payload bytes per sub-block

	std::vector<uint8_t> &Codes;
	uint32_t Accum = 0;
	int BitPos = 0;
	int InitBits;			// code size after a clear, in bits
	int CodeSize;			// in bits
	int MaxCode;			// largest code representable with CodeSize bits
	int ClearCode;
	int EOICode;
	int NextCode;			// next code to assign
	bool ClearPending = false;
	int HShift;
	uint8_t Chunk[MAX_CHUNK + 1];	// first byte is length

	// The dictionary maps code strings to code words. A code string is a code
	// word with one pixel value appended, packed into one integer as
	// (pixel << CODE_BITS) + code word. HashTab holds those keys (-1 marks an
	// empty slot) and CodeTab the code word assigned to each.
	int32_t HashTab[HSIZE];
	uint16_t CodeTab[HSIZE];

	void ClearHash();
	void WriteCode(int code);
	void AddChar(uint8_t c);
	void Dump();
};

void LZWCompress(std::vector<uint8_t> &vec, const uint8_t *pixels, size_t count, uint8_t colordepth);

struct LogicalScreenDescriptor
{
	uint16_t Width;
	uint16_t Height;
	uint8_t Flags;
	uint8_t BkgColor;
	uint8_t AspectRatio;
};

struct GraphicControlExtension
{
	uint8_t ExtensionIntroducer;
	uint8_t GraphicControlLabel;
	uint8_t BlockSize;
	uint8_t Flags;
	uint16_t DelayTime;
	uint8_t TransparentColor;
	uint8_t BlockTerminator;
};

struct ImageDescriptor
{
	uint16_t Left;
	uint16_t Top;
	uint16_t Width;
	uint16_t Height;
	uint8_t Flags;
};

struct GIFFrame
{
	GIFFrame();

	void SetDelay(int centisecs) { GCE.DelayTime = LittleShort((uint16_t)centisecs); }
	void Write(std::vector<uint8_t> &out) const;

	GraphicControlExtension GCE;
	ImageDescriptor IMD;
	Palette LocalPalette;
	std::vector<uint8_t> LZW;
};

struct GIFOptions
{
	int Width = 0;
	int Height = 0;
	int Delay = 0;			// milliseconds between frames
	int Quality = 10;		// NeuQuant sample factor, 1 (best) .. 30 (fastest)
	int Repeat = 0;			// 0 = forever, -1 = no looping extension, N = N times
	bool Verbose = false;
};

// Thrown by GIFWriter::Encode when there is nothing to encode.
class NoFramesError : public std::runtime_error
{
public:
	NoFramesError() : std::runtime_error("no frames to encode") {}
};

// Receives the percentage of frames encoded so far.
typedef std::function<void(int)> ProgressFunc;

class GIFWriter
{
public:
	enum { MIN_QUALITY = 1, MAX_QUALITY = 30 };

	GIFWriter(const GIFOptions &options);

	void AddFrame(ChunkyBitmap &&frame);
	// pixels holds len bytes of tightly packed RGB (bpp 3) or RGBA (bpp 4).
	void AddFrame(const uint8_t *pixels, size_t len, int bpp);
	size_t NumFrames() const { return Frames.size(); }
	int GetQuality() const { return Options.Quality; }

	// Quantize and compress every frame, returning the finished GIF.
	std::vector<uint8_t> Encode(const ProgressFunc &progress = nullptr);

	// Throws std::invalid_argument for a delay or repeat count GIF cannot store.
	static void CheckOptions(const GIFOptions &options);
	static int ClampQuality(int quality);
	static int DelayToCentisecs(int ms) { return (ms + 5) / 10; }

private:
	GIFOptions Options;
	std::vector<ChunkyBitmap> Frames;
	bool Finished = false;

	void WriteHeader(std::vector<uint8_t> &out) const;
	GIFFrame MakeFrame(const ChunkyBitmap &chunky) const;
};

bool SaveGIF(const std::string &filename, const std::vector<uint8_t> &data);

// Reads a binary PPM (P6) or PAM (P7) image.
bool LoadNetpbm(const std::string &filename, std::istream &file, ChunkyBitmap &out);
bool LoadNetpbm(const std::string &filename, ChunkyBitmap &out);

// Command Line options
struct Opts
{
	std::vector<std::pair<unsigned, unsigned>> Clips;
	std::vector<std::string> InPathnames;
	std::string OutPathname = "anim.gif";
	GIFOptions Encoder;

	bool ParseClip(char *clipstr);
	void SortClips();
	bool WantFrame(unsigned framenum) const;
};
