#include <sstream>
#include "errors.h"
#include "coloc.h"
#include "stats.h"
#include "volcoloc.h"
#include "hcvcoloc.h"

#include "version.h"

const char *version() { return __version__; }

static void check_same_shape(const char *what, int z1, int h1, int w1, int z2, int h2, int w2)
{
	if (z1 == z2 && h1 == h2 && w1 == w2) return;
	std::ostringstream ss;
	ss << what << ": shape (" << z1 << "," << h1 << "," << w1 << ") vs (" <<
		z2 << "," << h2 << "," << w2 << ")";
	throw ShapeMismatchError(ss.str());
}

double channel_threshold(unsigned short *data3d, int zd3d, int hd3d, int wd3d,
		double percent, double *p_max)
{
	VoxelVolume vol(Grid3D(wd3d, hd3d, zd3d), data3d);
	ThresholdParams params;
	params.threshold_percent = percent;
	ThresholdEstimator est(params);
	Channel ch = est.single(Channel(), vol);
	if (p_max) *p_max = ch.max;
	return ch.threshold;
}

PairedThreshold bimodal_thresholds(unsigned short *data_a, int za, int ha, int wa,
		unsigned short *data_b, int zb, int hb, int wb, bool clamp)
{
	check_same_shape("bimodal_thresholds", za, ha, wa, zb, hb, wb);
	VoxelVolume va(Grid3D(wa, ha, za), data_a);
	VoxelVolume vb(Grid3D(wb, hb, zb), data_b);
	ThresholdParams params;
	params.clamp_paired = clamp;
	return paired_thresholds(va, vb, params);
}

std::vector<double> colocalization(unsigned short *data_a, int za, int ha, int wa,
		unsigned short *data_b, int zb, int hb, int wb, double thr_a, double thr_b)
{
	check_same_shape("colocalization", za, ha, wa, zb, hb, wb);
	VoxelVolume va(Grid3D(wa, ha, za), data_a);
	VoxelVolume vb(Grid3D(wb, hb, zb), data_b);
	PairCoefficient pc = overlap_coefficients(va, vb, thr_a, thr_b);
	std::vector<double> res;
	res.push_back(pc.m_a);
	res.push_back(pc.m_b);
	res.push_back(double(pc.joint_voxels));
	return res;
}

long long volume_colocalization(unsigned char *mask1, int zm1, int hm1, int wm1,
		unsigned char *mask2, int zm2, int hm2, int wm2,
		unsigned char *out, int zo, int ho, int wo)
{
	check_same_shape("volume_colocalization", zm1, hm1, wm1, zo, ho, wo);
	BinaryMask m1(Grid3D(wm1, hm1, zm1), mask1);
	BinaryMask m2(Grid3D(wm2, hm2, zm2), mask2);
	BinaryMask res = colocalize_masks(m1, m2);
	memcpy(out, res.buf, size_t(res.len));
	return res.count();
}

std::vector<double> summary(std::vector<double> values, bool population_std)
{
	Summary s = summarize(values, population_std ? STD_POPULATION : STD_SAMPLE);
	std::vector<double> res;
	res.push_back(double(s.count));
	res.push_back(s.min);
	res.push_back(s.max);
	res.push_back(s.median);
	res.push_back(s.sum);
	res.push_back(s.mean);
	res.push_back(s.stdev);
	return res;
}
