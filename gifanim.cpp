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
#include <memory>
#include <getopt.h>
#include "gifanim.h"

static int usage(const char *progname)
{
	fprintf(stderr,
"Usage: %s [options] <frame files...>\n"
"  Frames are binary PPM (P6) or PAM (P7, RGB or RGB_ALPHA) images,\n"
"  all the same size, given in display order.\n"
"  Options:\n"
"    -o <file>        Write the animation to <file>. Default is anim.gif.\n"
"    -d <delay>       Delay between frames in milliseconds. Default is 100.\n"
"    -r <frame rate>  Set the delay from a frame rate instead.\n"
"    -q <quality>     Color sampling, 1 (best) to 30 (fastest). Default is 10.\n"
"    -l <loops>       Number of times to play. 0 loops forever (the default),\n"
"                     -1 plays once without a looping extension.\n"
"    -c <frames>      Clip out only the specified frames from the input.\n"
"                     This is a comma-separated range of frames of the\n"
"                     form \"start-end\" or a single frame number.\n"
"    -v               Report progress while encoding.\n",
		progname);
	return 1;
}

int main(int argc, char *argv[])
{
	Opts options;
	int opt;

	options.Encoder.Delay = 100;
	while ((opt = getopt(argc, argv, "o:d:r:q:l:c:v")) != -1)
	{
		switch (opt)
		{
		case 'o':
			options.OutPathname = optarg;
			break;
		case 'd':
			options.Encoder.Delay = atoi(optarg);
			if (options.Encoder.Delay < 0)
			{
				fprintf(stderr, "Delay must not be negative\n");
				return 1;
			}
			break;
		case 'r':
		{
			int rate = atoi(optarg);
			if (rate <= 0)
			{
				fprintf(stderr, "Frame rate must be at least 1\n");
				return 1;
			}
			options.Encoder.Delay = (1000 + rate / 2) / rate;
			break;
		}
		case 'q':
			options.Encoder.Quality = atoi(optarg);
			break;
		case 'l':
			options.Encoder.Repeat = atoi(optarg);
			break;
		case 'c':
			if (!options.ParseClip(optarg))
				return 1;
			break;
		case 'v':
			options.Encoder.Verbose = true;
			break;
		default:
			return usage(argv[0]);
		}
	}

	if (options.Encoder.Quality < GIFWriter::MIN_QUALITY || options.Encoder.Quality > GIFWriter::MAX_QUALITY)
	{
		fprintf(stderr, "Quality must be between %d and %d\n", GIFWriter::MIN_QUALITY, GIFWriter::MAX_QUALITY);
		return 1;
	}
	try
	{
		GIFWriter::CheckOptions(options.Encoder);
	}
	catch (const std::invalid_argument &err)
	{
		fprintf(stderr, "%s\n", err.what());
		return 1;
	}
	if (optind >= argc)
	{
		return usage(argv[0]);
	}
	for (int i = optind; i < argc; ++i)
	{
		options.InPathnames.push_back(argv[i]);
	}
	options.SortClips();

	// The first wanted frame decides the size of the animation.
	std::unique_ptr<GIFWriter> writer;
	unsigned framenum = 0;
	for (const std::string &pathname : options.InPathnames)
	{
		if (!options.WantFrame(++framenum))
		{
			continue;
		}
		ChunkyBitmap frame;
		if (!LoadNetpbm(pathname, frame))
		{
			return 2;
		}
		try
		{
			if (writer == nullptr)
			{
				if (options.Encoder.Verbose)
				{
					fprintf(stderr, "%dx%dx%d\n", frame.Width, frame.Height, frame.BytesPerPixel * 8);
				}
				options.Encoder.Width = frame.Width;
				options.Encoder.Height = frame.Height;
				writer.reset(new GIFWriter(options.Encoder));
			}
			writer->AddFrame(std::move(frame));
		}
		catch (const std::invalid_argument &err)
		{
			fprintf(stderr, "%s: %s\n", pathname.c_str(), err.what());
			return 2;
		}
	}
	if (writer == nullptr)
	{
		fprintf(stderr, "No frames to encode\n");
		return 2;
	}

	std::vector<uint8_t> gif;
	try
	{
		gif = writer->Encode([&options](int percent) {
			if (options.Encoder.Verbose)
			{
				fprintf(stderr, "Encoded %d%%\n", percent);
			}
		});
	}
	catch (const std::exception &err)
	{
		fprintf(stderr, "Could not encode %s: %s\n", options.OutPathname.c_str(), err.what());
		return 3;
	}
	if (!SaveGIF(options.OutPathname, gif))
	{
		return 3;
	}
	if (options.Encoder.Verbose)
	{
		fprintf(stderr, "Wrote %zu bytes to %s\n", gif.size(), options.OutPathname.c_str());
	}
	return 0;
}
