#include <sstream>
#include "errors.h"
#include "peak.h"
#include "threshold.h"

//----------------------------- ThresholdParams -------------------------------

void ThresholdParams::validate() const
{
	if (!(threshold_percent >= 0. && threshold_percent <= 100.)) {
		std::ostringstream ss;
		ss << "threshold percent must be within 0..100, got " << threshold_percent;
		throw std::invalid_argument(ss.str());
	}
	if (paired_a == paired_b)
		throw std::invalid_argument("paired channels must differ");
	if (!(paired_multiplier > 0.))
		throw std::invalid_argument("paired peak multiplier must be positive");
	if (axis_floor < 0.)
		throw std::invalid_argument("histogram axis floor must not be negative");
}

//----------------------------- Threshold functions ---------------------------

double percent_threshold(double max, double percent)
{
	if (!(percent >= 0. && percent <= 100.)) {
		std::ostringstream ss;
		ss << "threshold percent must be within 0..100, got " << percent;
		throw std::invalid_argument(ss.str());
	}
	return max * percent / 100.;
}

PairedThreshold paired_thresholds(const unsigned short *a, const unsigned short *b, long long n,
		const ThresholdParams& params)
{
	Histogram2D hist = build_joint_histogram(a, b, n, params.axis_floor);

	PairedThreshold res;
	res.max_a = double(max_sample(a, n));
	res.max_b = double(max_sample(b, n));
	res.peak_a = find_first_peak(hist.row_occupancy());
	res.peak_b = find_first_peak(hist.col_occupancy());
	res.threshold_a = params.paired_multiplier * res.peak_a;
	res.threshold_b = params.paired_multiplier * res.peak_b;
	if (params.clamp_paired) {
		if (res.threshold_a > res.max_a) res.threshold_a = res.max_a;
		if (res.threshold_b > res.max_b) res.threshold_b = res.max_b;
	}
	return res;
}

PairedThreshold paired_thresholds(const VoxelVolume& va, const VoxelVolume& vb,
		const ThresholdParams& params)
{
	if (!va.getGrid().sameShape(vb.getGrid())) {
		std::ostringstream ss;
		ss << "paired threshold: volumes differ in shape, " <<
			va.getGrid().describe() << " vs " << vb.getGrid().describe();
		throw ShapeMismatchError(ss.str());
	}
	return paired_thresholds(va.buf, vb.buf, va.len, params);
}

//----------------------------- ThresholdEstimator ----------------------------

ThresholdEstimator::ThresholdEstimator(const ThresholdParams& _params) : params(_params)
{
	params.validate();
}

Channel ThresholdEstimator::single(const Channel& ch, const VoxelVolume& vol) const
{
	if (vol.len <= 0)
		throw EmptyInputError("channel " + ch.name + ": no samples");
	Channel res = ch;
	res.max = double(vol.maxValue());
	res.threshold = percent_threshold(res.max, params.threshold_percent);
	return res;
}

ChannelSet ThresholdEstimator::estimate(const ChannelSet& channels, const VolumeSet& volumes) const
{
	ChannelSet res;
	for (ChannelSet::const_iterator it = channels.begin(); it != channels.end(); ++it) {
		const Channel& ch = it->second;
		if (ch.id == params.paired_a || ch.id == params.paired_b) continue;
		res[it->first] = single(ch, volume_of(volumes, it->first));
	}

	ChannelSet::const_iterator ita = channels.find(params.paired_a);
	ChannelSet::const_iterator itb = channels.find(params.paired_b);
	if (ita != channels.end() && itb != channels.end()) {
		PairedThreshold pt = paired_thresholds(volume_of(volumes, params.paired_a),
				volume_of(volumes, params.paired_b), params);
		Channel cha = ita->second;
		cha.max = pt.max_a;
		cha.threshold = pt.threshold_a;
		Channel chb = itb->second;
		chb.max = pt.max_b;
		chb.threshold = pt.threshold_b;
		res[ita->first] = cha;
		res[itb->first] = chb;
	} else {
		// A lone member of the pair falls back to percent of max
		if (ita != channels.end())
			res[ita->first] = single(ita->second, volume_of(volumes, ita->first));
		if (itb != channels.end())
			res[itb->first] = single(itb->second, volume_of(volumes, itb->first));
	}
	return res;
}
