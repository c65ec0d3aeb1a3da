#ifndef hcvcoloc_h
#define hcvcoloc_h

#include "threshold.h"

// Flat entry points over raw numpy-style buffers, for scripting bindings.
// 3D arrays are (num_frames, height, width) in C order, as passed by the binding.

// Return module version as str
const char* version();

// thr = hcvcoloc.channel_threshold(data3d[, percent])
//
// data3d - numpy array of shape (num_frames, height, width), dtype=uint16, one channel
// percent - (optional, default 15) threshold as percentage of the channel maximum, 0..100
// Returns the threshold; the channel maximum is stored in *p_max when given.
double channel_threshold(unsigned short *data3d, int zd3d, int hd3d, int wd3d,
		double percent=DEFAULT_THRESHOLD_PERCENT, double *p_max=NULL);

// res = hcvcoloc.bimodal_thresholds(data_a, data_b[, clamp])
//
// data_a, data_b - numpy arrays of identical shape (num_frames, height, width), dtype=uint16,
//		two channels imaged together (Core and LDs in the HCV protocol)
// clamp - (optional, default False) clamp thresholds to the channel maxima
// Returns peak bins, thresholds and maxima of both channels.
PairedThreshold bimodal_thresholds(unsigned short *data_a, int za, int ha, int wa,
		unsigned short *data_b, int zb, int hb, int wb, bool clamp=false);

// (m_a, m_b, joint_voxels) = hcvcoloc.colocalization(data_a, data_b, thr_a, thr_b)
//
// Thresholded Manders' coefficients: share of each channel's above-threshold intensity
// located in voxels where both channels exceed their thresholds.
std::vector<double> colocalization(unsigned short *data_a, int za, int ha, int wa,
		unsigned short *data_b, int zb, int hb, int wb, double thr_a, double thr_b);

// nvox = hcvcoloc.volume_colocalization(mask1, mask2, out)
//
// mask1, mask2 - numpy arrays (num_frames, height, width), dtype=uint8, 0=outside, non-zero=inside,
//		masks of two surfaces on the same grid
// out - numpy array of the same shape, dtype=uint8; receives the intersection mask (0/1)
// Returns the number of colocalized voxels.
long long volume_colocalization(unsigned char *mask1, int zm1, int hm1, int wm1,
		unsigned char *mask2, int zm2, int hm2, int wm2,
		unsigned char *out, int zo, int ho, int wo);

// (count, min, max, median, sum, mean, stdev) = hcvcoloc.summary(values[, population_std])
//
// values - list of per-object values (volumes or sphericities), must not be empty
// population_std - (optional, default False) divide by N instead of N-1
std::vector<double> summary(std::vector<double> values, bool population_std=false);

#endif
