#ifndef histogram_h
#define histogram_h

#include "raster.h"

const int HIST_BINS = 256;

// Axis floor of the HCV acquisition protocol for 8-bit data:
// the joint histogram axis never spans less than 0..255.
const double REFERENCE_AXIS_FLOOR = 255.;

// Bin index of an intensity value on a HIST_BINS axis spanning [0, axis_max]:
// floor(v * HIST_BINS / axis_max), clamped to the last bin. All values fall in bin 0 if axis_max is 0.
int hist_bin(double v, double axis_max);

// Intensity histogram with HIST_BINS linear bins spanning [0, axis_max].
// Counts are raw, never renormalized.
class Histogram1D
{
protected:
	std::vector<uint64> bins;
	double axis_max;
	uint64 ccount;
public:
	Histogram1D(double _axis_max);
	int getNbins() const { return int(bins.size()); }
	uint64 getCount() const { return ccount; }
	double axisMax() const { return axis_max; }
	uint64 operator[](int idx) const { return bins[idx]; }
	const std::vector<uint64>& values() const { return bins; }
	void add_samples(const unsigned short *buf, long long len);
};

// Joint (co-occurrence) histogram of two channels sampled at the same voxels.
// Rows are channel A bins, columns are channel B bins; both axes share axis_max.
class Histogram2D
{
protected:
	std::vector<uint64> bins;
	double axis_max;
	uint64 ccount;
public:
	Histogram2D(double _axis_max);
	uint64 getCount() const { return ccount; }
	double axisMax() const { return axis_max; }
	uint64 value(int row, int col) const { return bins[size_t(row) * HIST_BINS + col]; }
	void add_samples(const unsigned short *bufa, const unsigned short *bufb, long long len);
	// Occupancy profiles: for each row (col), the number of non-empty cells in it.
	// Binarizing first keeps the dense background cluster from dominating the profile.
	std::vector<uint64> row_occupancy() const;
	std::vector<uint64> col_occupancy() const;
};

// 1D histogram of raw samples. The axis spans 0..max(observed max, axis_floor).
Histogram1D build_histogram(const unsigned short *samples, long long n, double axis_floor=0.);
Histogram1D build_histogram(const VoxelVolume& vol, double axis_floor=0.);

// Joint histogram of two equal-length sample arrays over their common maximum.
Histogram2D build_joint_histogram(const unsigned short *a, const unsigned short *b, long long n,
		double axis_floor=0.);
Histogram2D build_joint_histogram(const VoxelVolume& va, const VoxelVolume& vb, double axis_floor=0.);

#endif
