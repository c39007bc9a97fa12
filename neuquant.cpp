/* NeuQuant Neural-Net Quantization Algorithm
 * ------------------------------------------
 *
 * Copyright (c) 1994 Anthony Dekker
 *
 * NEUQUANT Neural-Net quantization algorithm by Anthony Dekker, 1994.
 * See "Kohonen neural networks for optimal colour quantization"
 * in "Network: Computation in Neural Systems" Vol. 5 (1994) pp 351-367.
 * for a discussion of the algorithm.
 * See also  http://www.acm.org/~dekker/NEUQUANT.HTML
 *
 * Any party obtaining a copy of these files from the author, directly or
 * indirectly, is granted, free of charge, a full and unrestricted irrevocable,
 * world-wide, paid up, royalty-free, nonexclusive right and license to deal
 * in this software and documentation files (the "Software"), including without
 * limitation the rights to use, copy, modify, merge, publish, distribute, sublicense,
 * and/or sell copies of the Software, and to permit persons who receive
 * copies from any such party to do so, with the only requirement being
 * that this copyright notice remain intact.
 */

#include <stdio.h>
#include <climits>
#include <utility>
#include "gifanim.h"

static constexpr int ncycles = 100;			// no. of learning cycles

static constexpr int netsize = NeuQuant::NETSIZE;	// number of colours used
static constexpr int maxnetpos = netsize - 1;

// Four primes near 500 - assume no image has a length so large
// that it is divisible by all four primes
static constexpr int prime1 = 499;
static constexpr int prime2 = 491;
static constexpr int prime3 = 487;
static constexpr int prime4 = 503;
static constexpr size_t minpicturebytes = 3 * prime4;	// minimum size for input image

// Network definitions
static constexpr int netbiasshift = 4;				// bias for colour values
static constexpr int intbiasshift = 16;				// bias for fractions
static constexpr int intbias = 1 << intbiasshift;
static constexpr int gammashift = 10;				// gamma = 1024
static constexpr int betashift = 10;
static constexpr int beta = intbias >> betashift;	// beta = 1/1024
static constexpr int betagamma = intbias << (gammashift - betashift);

// Definitions for decreasing radius factor
static constexpr int initrad = netsize >> 3;		// for 256 cols, radius starts
static constexpr int radiusbiasshift = 6;			// at 32.0 biased by 6 bits
static constexpr int radiusbias = 1 << radiusbiasshift;
static constexpr int initradius = initrad * radiusbias;	// and decreases by a
static constexpr int radiusdec = 30;				// factor of 1/30 each cycle

// Definitions for decreasing alpha factor
static constexpr int alphabiasshift = 10;			// alpha starts at 1.0
static constexpr int initalpha = 1 << alphabiasshift;

// radbias and alpharadbias used for radpower calculation
static constexpr int radbiasshift = 8;
static constexpr int radbias = 1 << radbiasshift;
static constexpr int alpharadbshift = alphabiasshift + radbiasshift;
static constexpr int alpharadbias = 1 << alpharadbshift;

NeuQuant::NeuQuant(const uint8_t *rgb, size_t len, int sample, bool verb)
	: thepicture(rgb), lengthcount(len), samplefac(sample), verbose(verb)
{
	if (sample < 1 || sample > 30) throw std::out_of_range("Sample must be 1..30");
	if (len == 0 || len % 3 != 0) throw std::invalid_argument("Picture must hold a whole number of RGB pixels");

	// Start every neuron on the gray diagonal.
	for (int i = 0; i < netsize; i++) {
		int *p = network[i];
		p[0] = p[1] = p[2] = (i << (netbiasshift + 8)) / netsize;
		p[3] = i;
		freq[i] = intbias / netsize;	// 1/netsize
		bias[i] = 0;
	}
}

void NeuQuant::calcradpower(int alpha, int rad)
{
	for (int i = 0; i < rad; i++) {
		radpower[i] = alpha * (((rad * rad - i * i) * radbias) / (rad * rad));
	}
}

void NeuQuant::altersingle(int alpha, int i, int r, int g, int b)
{
	// Move neuron i towards biased (r,g,b) by factor alpha
	int *n = network[i];				// alter hit neuron
	n[0] -= (alpha * (n[0] - r)) / initalpha;
	n[1] -= (alpha * (n[1] - g)) / initalpha;
	n[2] -= (alpha * (n[2] - b)) / initalpha;
}

void NeuQuant::alterneigh(int rad, int i, int r, int g, int b)
{
	// Move adjacent neurons by precomputed alpha*(1-((i-j)^2/[r]^2)) in radpower[|i-j|]
	int lo = i - rad;   if (lo < -1) lo = -1;
	int hi = i + rad;   if (hi > netsize) hi = netsize;

	int j = i + 1;
	int k = i - 1;
	int m = 1;
	while ((j < hi) || (k > lo)) {
		int a = radpower[m++];
		if (j < hi) {
			int *p = network[j++];
			p[0] -= (a * (p[0] - r)) / alpharadbias;
			p[1] -= (a * (p[1] - g)) / alpharadbias;
			p[2] -= (a * (p[2] - b)) / alpharadbias;
		}
		if (k > lo) {
			int *p = network[k--];
			p[0] -= (a * (p[0] - r)) / alpharadbias;
			p[1] -= (a * (p[1] - g)) / alpharadbias;
			p[2] -= (a * (p[2] - b)) / alpharadbias;
		}
	}
}

int NeuQuant::contest(int r, int g, int b)
{
	// finds closest neuron (min dist) and updates freq
	// finds best neuron (min dist-bias) and returns position
	// for frequently chosen neurons, freq[i] is high and bias[i] is negative
	// bias[i] = gamma*((1/netsize)-freq[i])

	int bestd = INT_MAX;
	int bestbiasd = bestd;
	int bestpos = -1;
	int bestbiaspos = bestpos;

	for (int i = 0; i < netsize; i++) {
		const int *n = network[i];
		int dist = abs(n[0] - r) + abs(n[1] - g) + abs(n[2] - b);
		if (dist < bestd) { bestd = dist; bestpos = i; }
		int biasdist = dist - (bias[i] >> (intbiasshift - netbiasshift));
		if (biasdist < bestbiasd) { bestbiasd = biasdist; bestbiaspos = i; }
		int betafreq = freq[i] >> betashift;
		freq[i] -= betafreq;
		bias[i] += betafreq << gammashift;
	}
	freq[bestpos] += beta;
	bias[bestpos] -= betagamma;
	return bestbiaspos;
}

void NeuQuant::learn()
{
	if (lengthcount < minpicturebytes) {
		// Too small to stride over; visit every pixel.
		samplefac = 1;
		step = 3;
	}
	else if (lengthcount % prime1 != 0) step = 3 * prime1;
	else if (lengthcount % prime2 != 0) step = 3 * prime2;
	else if (lengthcount % prime3 != 0) step = 3 * prime3;
	else step = 3 * prime4;

	int alphadec = 30 + ((samplefac - 1) / 3);
	size_t samplepixels = lengthcount / (3 * samplefac);
	size_t delta = samplepixels / ncycles;
	if (delta == 0) delta = 1;
	int alpha = initalpha;
	int radius = initradius;

	int rad = radius >> radiusbiasshift;
	if (rad <= 1) rad = 0;
	calcradpower(alpha, rad);

	if (verbose) {
		fprintf(stderr, "beginning 1D learning: samplepixels=%zu  step=%d  rad=%d\n", samplepixels, step, rad);
	}

	size_t pix = 0;
	for (size_t i = 0; i < samplepixels; ) {
		int r = thepicture[pix + 0] << netbiasshift;
		int g = thepicture[pix + 1] << netbiasshift;
		int b = thepicture[pix + 2] << netbiasshift;

		int j = contest(r, g, b);
		altersingle(alpha, j, r, g, b);
		if (rad) alterneigh(rad, j, r, g, b);   // alter neighbours

		pix += step;
		if (pix >= lengthcount) pix -= lengthcount;

		i++;
		if (i % delta == 0) {
			alpha -= alpha / alphadec;
			radius -= radius / radiusdec;
			rad = radius >> radiusbiasshift;
			if (rad <= 1) rad = 0;
			calcradpower(alpha, rad);
		}
	}
	if (verbose) {
		fprintf(stderr, "finished 1D learning: final alpha=%f!\n", (1.0 * alpha) / initalpha);
	}
}

void NeuQuant::unbias()
{
	// Unbias network to give byte values 0..255 and record position i to prepare for sort
	for (int i = 0; i < netsize; i++) {
		for (int j = 0; j < 3; j++) {
			int x = (network[i][j] + (1 << (netbiasshift - 1))) >> netbiasshift;
			if (x < 0) x = 0;
			if (x > 255) x = 255;
			network[i][j] = x;
		}
		network[i][3] = i;
	}
}

void NeuQuant::inxbuild()
{
	// Insertion sort of network and building of netindex[0..255]

	int previouscol = 0;
	int startpos = 0;

	for (int i = 0; i < netsize; i++) {
		int *p = network[i];
		int smallpos = i;
		int smallval = p[1];			// index on g
		// find smallest in i..netsize-1
		for (int j = i + 1; j < netsize; j++) {
			const int *q = network[j];
			if (q[1] < smallval) {		// index on g
				smallpos = j;
				smallval = q[1];	// index on g
			}
		}
		// swap p (i) and q (smallpos) entries
		if (i != smallpos) {
			int *q = network[smallpos];
			for (int j = 0; j < 4; j++) std::swap(p[j], q[j]);
		}
		// smallval entry is now in position i
		if (smallval != previouscol) {
			netindex[previouscol] = (startpos + i) >> 1;
			for (int j = previouscol + 1; j < smallval; j++) netindex[j] = i;
			previouscol = smallval;
			startpos = i;
		}
	}
	netindex[previouscol] = (startpos + maxnetpos) >> 1;
	for (int j = previouscol + 1; j < (int)countof(netindex); j++) netindex[j] = maxnetpos;
}

Palette NeuQuant::GetPalette()
{
	if (!trained) {
		learn();
		unbias();
		inxbuild();
		trained = true;
	}
	std::vector<ColorRegister> pal(netsize);
	for (int i = 0; i < netsize; ++i) {
		pal[i] = ColorRegister(network[i][0], network[i][1], network[i][2]);
	}
	return pal;
}

int NeuQuant::Lookup(int r, int g, int b) const
{
	// Search for RGB values 0..255 and return colour index
	int bestd = 1000;		// biggest possible dist is 256*3
	int best = -1;
	int i = netindex[g];	// index on g
	int j = i - 1;		// start at netindex[g] and work outwards

	while ((i < netsize) || (j >= 0)) {
		if (i < netsize) {
			const int *p = network[i];
			int dist = p[1] - g;		// inx key
			if (dist >= bestd) i = netsize;	// stop iter
			else {
				if (dist < 0) dist = -dist;
				dist += abs(p[0] - r);
				if (dist < bestd) {
					dist += abs(p[2] - b);
					if (dist < bestd) { bestd = dist; best = i; }
				}
				i++;
			}
		}
		if (j >= 0) {
			const int *p = network[j];
			int dist = g - p[1]; // inx key - reverse dif
			if (dist >= bestd) j = -1; // stop iter
			else {
				if (dist < 0) dist = -dist;
				dist += abs(p[0] - r);
				if (dist < bestd) {
					dist += abs(p[2] - b);
					if (dist < bestd) { bestd = dist; best = j; }
				}
				j--;
			}
		}
	}

	return best;
}
