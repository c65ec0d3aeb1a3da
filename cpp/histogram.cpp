#include <sstream>
#include "errors.h"
#include "histogram.h"

int hist_bin(double v, double axis_max)
{
	if (axis_max <= 0. || v <= 0.) return 0;
	int b = int(floor(v * HIST_BINS / axis_max));
	if (b >= HIST_BINS) b = HIST_BINS - 1;
	return b;
}

//----------------------------- Histogram1D -----------------------------------

Histogram1D::Histogram1D(double _axis_max) : bins(HIST_BINS, 0), axis_max(_axis_max), ccount(0)
{
}

void Histogram1D::add_samples(const unsigned short *buf, long long len)
{
	for (long long i=0; i<len; i++)
		++bins[hist_bin(double(buf[i]), axis_max)];
	if (len > 0)
		ccount += len;
}

//----------------------------- Histogram2D -----------------------------------

Histogram2D::Histogram2D(double _axis_max) :
		bins(size_t(HIST_BINS) * HIST_BINS, 0), axis_max(_axis_max), ccount(0)
{
}

void Histogram2D::add_samples(const unsigned short *bufa, const unsigned short *bufb, long long len)
{
	for (long long i=0; i<len; i++) {
		int row = hist_bin(double(bufa[i]), axis_max);
		int col = hist_bin(double(bufb[i]), axis_max);
		++bins[size_t(row) * HIST_BINS + col];
	}
	if (len > 0)
		ccount += len;
}

std::vector<uint64> Histogram2D::row_occupancy() const
{
	std::vector<uint64> res(HIST_BINS, 0);
	for (int row=0; row<HIST_BINS; row++) {
		const uint64 *p = &bins[size_t(row) * HIST_BINS];
		for (int col=0; col<HIST_BINS; col++)
			if (p[col] > 0) ++res[row];
	}
	return res;
}

std::vector<uint64> Histogram2D::col_occupancy() const
{
	std::vector<uint64> res(HIST_BINS, 0);
	for (int row=0; row<HIST_BINS; row++) {
		const uint64 *p = &bins[size_t(row) * HIST_BINS];
		for (int col=0; col<HIST_BINS; col++)
			if (p[col] > 0) ++res[col];
	}
	return res;
}

//----------------------------- Builders --------------------------------------

Histogram1D build_histogram(const unsigned short *samples, long long n, double axis_floor)
{
	if (!samples || n <= 0)
		throw EmptyInputError("histogram: no samples");
	double axis_max = std::max(double(max_sample(samples, n)), axis_floor);
	Histogram1D hist(axis_max);
	hist.add_samples(samples, n);
	return hist;
}

Histogram1D build_histogram(const VoxelVolume& vol, double axis_floor)
{
	return build_histogram(vol.buf, vol.len, axis_floor);
}

Histogram2D build_joint_histogram(const unsigned short *a, const unsigned short *b, long long n,
		double axis_floor)
{
	if (!a || !b || n <= 0)
		throw EmptyInputError("joint histogram: no samples");
	double axis_max = std::max(double(std::max(max_sample(a, n), max_sample(b, n))), axis_floor);
	Histogram2D hist(axis_max);
	hist.add_samples(a, b, n);
	return hist;
}

Histogram2D build_joint_histogram(const VoxelVolume& va, const VoxelVolume& vb, double axis_floor)
{
	if (!va.getGrid().sameShape(vb.getGrid())) {
		std::ostringstream ss;
		ss << "joint histogram: volumes differ in shape, " <<
			va.getGrid().describe() << " vs " << vb.getGrid().describe();
		throw ShapeMismatchError(ss.str());
	}
	return build_joint_histogram(va.buf, vb.buf, va.len, axis_floor);
}
