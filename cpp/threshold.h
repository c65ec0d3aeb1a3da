#ifndef threshold_h
#define threshold_h

#include "channels.h"
#include "histogram.h"

// Single-channel threshold as a percentage of the channel maximum
const double DEFAULT_THRESHOLD_PERCENT = 15.;
// The binarized-profile peak underestimates the separating intensity;
// the empirical correction of the HCV protocol is a factor of 2.
const double PAIRED_PEAK_MULTIPLIER = 2.;

struct ThresholdParams
{
	double threshold_percent;
	int paired_a, paired_b;		// channels thresholded together from the joint histogram
	double paired_multiplier;
	bool clamp_paired;			// clamp paired thresholds to the channel max
	double axis_floor;			// joint histogram axis floor, 0 = observed maximum
	ThresholdParams() :
		threshold_percent(DEFAULT_THRESHOLD_PERCENT),
		paired_a(CH_CORE), paired_b(CH_LDS),
		paired_multiplier(PAIRED_PEAK_MULTIPLIER),
		clamp_paired(false),
		axis_floor(0.) {}
	// Throws std::invalid_argument on out-of-range values
	void validate() const;
};

struct PairedThreshold
{
	int peak_a, peak_b;			// peak bins of the row (A) and column (B) occupancy profiles
	double threshold_a, threshold_b;
	double max_a, max_b;
};

// max * percent / 100, percent in [0,100]
double percent_threshold(double max, double percent);

// Bimodal joint-histogram method. Thresholds are multiplier * peak bin;
// they are not clamped to the channel max unless params.clamp_paired is set.
PairedThreshold paired_thresholds(const unsigned short *a, const unsigned short *b, long long n,
		const ThresholdParams& params);
PairedThreshold paired_thresholds(const VoxelVolume& va, const VoxelVolume& vb,
		const ThresholdParams& params);

class ThresholdEstimator
{
protected:
	ThresholdParams params;
public:
	ThresholdEstimator(const ThresholdParams& _params=ThresholdParams());
	// Percent-of-max threshold for one channel
	Channel single(const Channel& ch, const VoxelVolume& vol) const;
	// New channel records with max and threshold set for every channel in the set:
	// the configured pair by the bimodal method, all others by percent of max.
	ChannelSet estimate(const ChannelSet& channels, const VolumeSet& volumes) const;
};

#endif
