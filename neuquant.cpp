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

#include <float.h>
#include <algorithm>
#include <cstdlib>
#include <cmath>
#include <stdexcept>
#include "neuquant.h"

NeuQuant::NeuQuant(int sample)
	: samplefac(sample)
{
	if (sample < minsamplefac || sample > maxsamplefac) throw std::out_of_range("Sample must be 1..30");
	setUpArrays();
}

void NeuQuant::AddPixels(const uint8_t *rgba, size_t count)
{
	for (; count > 0; --count, rgba += 4)
	{
		pixels.push_back((rgba[0] << 16) | (rgba[1] << 8) | rgba[2]);
	}
}

void NeuQuant::AddPacked(const int *packed, size_t count)
{
	for (; count > 0; --count, ++packed)
	{
		pixels.push_back(*packed & 0xFFFFFF);
	}
}

Palette NeuQuant::GetPalette()
{
	init();
	std::vector<ColorRegister> pal(netsize);
	for (int i = 0; i < netsize; ++i)
	{
		pal[i] = getColor(i);
	}
	return pal;
}

void NeuQuant::init()
{
	if (pixels.size() < (size_t)minpixels)
	{
		throw std::length_error("Image is too small: need at least " + std::to_string(minpixels) +
			" pixels, got " + std::to_string(pixels.size()));
	}
	setUpArrays();
	learn();
	fix();
	inxbuild();
}

void NeuQuant::setUpArrays()
{
	network[0][0] = 0.0;	// black
	network[0][1] = 0.0;
	network[0][2] = 0.0;

	network[1][0] = 255.0;	// white
	network[1][1] = 255.0;
	network[1][2] = 255.0;

	// RESERVED bgColour	// background
	network[bgColour][0] = 0.0;
	network[bgColour][1] = 0.0;
	network[bgColour][2] = 0.0;

	for (int i = 0; i < specials; i++) {
		freq[i] = 1.0 / netsize;
		bias[i] = 0.0;
	}

	for (int i = specials; i < netsize; i++) {
		double *p = network[i];
		p[0] = (255.0 * (i - specials)) / cutnetsize;
		p[1] = (255.0 * (i - specials)) / cutnetsize;
		p[2] = (255.0 * (i - specials)) / cutnetsize;

		freq[i] = 1.0 / netsize;
		bias[i] = 0.0;
	}

	learnlog = LearnLog();
}

// Move neuron i towards (r,g,b) by factor alpha
void NeuQuant::altersingle(double alpha, int i, double r, double g, double b)
{
	double *n = network[i];
	n[0] -= (alpha * (n[0] - r));
	n[1] -= (alpha * (n[1] - g));
	n[2] -= (alpha * (n[2] - b));
}

// Move the neurons up to rad positions on either side of i towards (r,g,b),
// with a strength that falls off with the square of the distance.
void NeuQuant::alterneigh(double alpha, int rad, int i, double r, double g, double b)
{
	int lo = i - rad;   if (lo < specials) lo = specials - 1;
	int hi = i + rad;   if (hi > netsize) hi = netsize;

	int j = i + 1;
	int k = i - 1;
	int q = 0;
	while ((j < hi) || (k > lo)) {
		double a = (alpha * (rad * rad - q * q)) / (rad * rad);
		q++;
		if (j < hi) {
			double *p = network[j];
			p[0] -= (a * (p[0] - r));
			p[1] -= (a * (p[1] - g));
			p[2] -= (a * (p[2] - b));
			j++;
		}
		if (k > lo) {
			double *p = network[k];
			p[0] -= (a * (p[0] - r));
			p[1] -= (a * (p[1] - g));
			p[2] -= (a * (p[2] - b));
			k--;
		}
	}
}

// Finds the closest neuron (min dist) and updates its freq.
// Finds the best neuron (min dist-bias) and returns its position.
// For frequently chosen neurons, freq[i] is high and bias[i] is negative.
// bias[i] = gamma*((1/netsize)-freq[i])
int NeuQuant::contest(double r, double g, double b)
{
	double bestd = DBL_MAX;
	double bestbiasd = bestd;
	int bestpos = -1;
	int bestbiaspos = bestpos;

	for (int i = specials; i < netsize; i++) {
		const double *n = network[i];
		double dist = std::fabs(n[0] - r) + std::fabs(n[1] - g) + std::fabs(n[2] - b);
		if (dist < bestd) { bestd = dist; bestpos = i; }
		double biasdist = dist - bias[i];
		if (biasdist < bestbiasd) { bestbiasd = biasdist; bestbiaspos = i; }
		freq[i] -= beta * freq[i];
		bias[i] += betagamma * freq[i];
	}
	freq[bestpos] += beta;
	bias[bestpos] -= betagamma;
	return bestbiaspos;
}

int NeuQuant::specialFind(double r, double g, double b) const
{
	for (int i = 0; i < specials; i++) {
		const double *n = network[i];
		if (std::fabs(n[0] - r) < 1e-5 && std::fabs(n[1] - g) < 1e-5 && std::fabs(n[2] - b) < 1e-5)
			return i;
	}
	return -1;
}

// The first prime that does not divide the pixel count.
int NeuQuant::selectStep(size_t lengthcount)
{
	if (lengthcount % prime1 != 0) return prime1;
	if (lengthcount % prime2 != 0) return prime2;
	if (lengthcount % prime3 != 0) return prime3;
	return prime4;
}

void NeuQuant::learn()
{
	int biasRadius = initBiasRadius;
	int alphadec = 30 + ((samplefac - 1) / 3);
	size_t lengthcount = pixels.size();
	size_t samplepixels = lengthcount / samplefac;
	size_t delta = samplepixels / ncycles;
	int alpha = initalpha;

	// Tiny samples at high sampling factors still decay once per pixel.
	if (delta == 0) delta = 1;

	int rad = calcRad(biasRadius);
	size_t step = selectStep(lengthcount);
	size_t pos = 0;

	learnlog.step = (int)step;
	learnlog.cycles.reserve(samplepixels / delta);

	fprintf(stderr, "beginning 1D learning: samplepixels=%zu  rad=%d  step=%zu\n", samplepixels, rad, step);

	size_t i = 0;
	while (i < samplepixels) {
		int p = pixels[pos];
		double r = (p >> 16) & 0xFF;
		double g = (p >> 8) & 0xFF;
		double b = p & 0xFF;

		if (i == 0) {   // remember background colour
			network[bgColour][0] = r;
			network[bgColour][1] = g;
			network[bgColour][2] = b;
		}

		int j = specialFind(r, g, b);
		j = j < 0 ? contest(r, g, b) : j;

		if (j >= specials) {   // don't learn for specials
			double a = (1.0 * alpha) / initalpha;
			altersingle(a, j, r, g, b);
			if (rad > 0) alterneigh(a, rad, j, r, g, b);   // alter neighbours
		}

		pos = (pos + step) % lengthcount;

		i++;
		if (i % delta == 0) {
			alpha -= alpha / alphadec;
			biasRadius -= biasRadius / radiusdec;
			rad = calcRad(biasRadius);
			learnlog.cycles.push_back({ alpha, biasRadius, rad });
		}
	}
	learnlog.visits = i;
	fprintf(stderr, "finished 1D learning: final alpha=%f!\n", (1.0 * alpha) / initalpha);
}

void NeuQuant::fix()
{
	for (int i = 0; i < netsize; i++) {
		for (int j = 0; j < 3; j++) {
			int x = (int)std::floor(0.5 + network[i][j]);
			if (x < 0) x = 0;
			if (x > 255) x = 255;
			colormap[i][j] = x;
		}
		colormap[i][3] = i;
		sortpos[i] = i;
	}
}

// Selection sort of the colour map by green and building of netindex[0..255]
void NeuQuant::inxbuild()
{
	int previouscol = 0;
	int startpos = 0;

	for (int i = 0; i < netsize; i++) {
		int *p = colormap[i];
		int *q = nullptr;
		int smallpos = i;
		int smallval = p[1];			// index on g
		// find smallest in i..netsize-1
		for (int j = i + 1; j < netsize; j++) {
			q = colormap[j];
			if (q[1] < smallval) {
				smallpos = j;
				smallval = q[1];
			}
		}
		q = colormap[smallpos];
		// swap p (i) and q (smallpos) entries
		if (i != smallpos) {
			for (int c = 0; c < 4; ++c) std::swap(p[c], q[c]);
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
	for (int j = previouscol + 1; j < 256; j++) netindex[j] = maxnetpos; // really 256

	for (int i = 0; i < netsize; i++) {
		sortpos[colormap[i][3]] = i;
	}
}

ColorRegister NeuQuant::getColor(int i) const
{
	if (i < 0 || i >= netsize) return { 0, 0, 0 };
	const int *c = colormap[sortpos[i]];
	return { c[0], c[1], c[2] };
}

ColorRegister NeuQuant::getSortedColor(int i) const
{
	if (i < 0 || i >= netsize) return { 0, 0, 0 };
	const int *c = colormap[i];
	return { c[0], c[1], c[2] };
}

// Search for RGB values 0..255, starting where the green index points and
// working outwards. A direction is abandoned once the green difference alone
// is at least the best distance found, since the map is sorted on green.
int NeuQuant::lookup(int r, int g, int b) const
{
	int bestd = 1000;		// biggest possible dist is 256*3
	int best = -1;
	int i = netindex[g & 0xFF];	// index on g
	int j = i - 1;		// start at netindex[g] and work outwards

	while ((i < netsize) || (j >= 0)) {
		if (i < netsize) {
			const int *p = colormap[i];
			int dist = p[1] - g;		// inx key
			if (dist >= bestd) i = netsize;	// stop iter
			else {
				if (dist < 0) dist = -dist;
				dist += std::abs(p[0] - r);
				if (dist < bestd) {
					dist += std::abs(p[2] - b);
					if (dist < bestd) { bestd = dist; best = i; }
				}
				i++;
			}
		}
		if (j >= 0) {
			const int *p = colormap[j];
			int dist = g - p[1]; // inx key - reverse dif
			if (dist >= bestd) j = -1; // stop iter
			else {
				if (dist < 0) dist = -dist;
				dist += std::abs(p[0] - r);
				if (dist < bestd) {
					dist += std::abs(p[2] - b);
					if (dist < bestd) { bestd = dist; best = j; }
				}
				j--;
			}
		}
	}

	return best < 0 ? 0 : colormap[best][3];
}

Quantizer *NewNeuQuant(int samplefac)
{
	return new NeuQuant(samplefac);
}
