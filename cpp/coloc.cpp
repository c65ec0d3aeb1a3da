#include <sstream>
#include <stdexcept>
#include "errors.h"
#include "coloc.h"

static std::string fmt_value(double v)
{
	std::ostringstream ss;
	ss << v;
	return ss.str();
}

PairCoefficient overlap_coefficients(const unsigned short *a, const unsigned short *b, long long n,
		double threshold_a, double threshold_b)
{
	if (!a || !b || n <= 0)
		throw EmptyInputError("colocalization: no samples");

	double sig_a = 0., sig_b = 0.;
	double joint_a = 0., joint_b = 0.;
	long long nj = 0;
	for (long long i=0; i<n; i++) {
		bool in_a = a[i] > threshold_a;
		bool in_b = b[i] > threshold_b;
		if (in_a) sig_a += double(a[i]);
		if (in_b) sig_b += double(b[i]);
		if (in_a && in_b) {
			joint_a += double(a[i]);
			joint_b += double(b[i]);
			++nj;
		}
	}
	if (sig_a <= 0.)
		throw EmptyInputError("colocalization: no signal above threshold " + fmt_value(threshold_a) + " in channel A");
	if (sig_b <= 0.)
		throw EmptyInputError("colocalization: no signal above threshold " + fmt_value(threshold_b) + " in channel B");

	PairCoefficient res;
	res.ch_a = res.ch_b = 0;
	res.m_a = joint_a / sig_a;
	res.m_b = joint_b / sig_b;
	res.joint_voxels = nj;
	return res;
}

PairCoefficient overlap_coefficients(const VoxelVolume& va, const VoxelVolume& vb,
		double threshold_a, double threshold_b)
{
	if (!va.getGrid().sameShape(vb.getGrid())) {
		std::ostringstream ss;
		ss << "colocalization: volumes differ in shape, " <<
			va.getGrid().describe() << " vs " << vb.getGrid().describe();
		throw ShapeMismatchError(ss.str());
	}
	return overlap_coefficients(va.buf, vb.buf, va.len, threshold_a, threshold_b);
}

//----------------------------- ColocalizationResult --------------------------

double ColocalizationResult::coefficient(int ch_a, int ch_b) const
{
	for (const PairCoefficient& pc : pairs) {
		if (pc.ch_a == ch_a && pc.ch_b == ch_b)
			return pc.m_a;
	}
	throw std::out_of_range("no colocalization computed for channels " +
		std::to_string(ch_a) + "/" + std::to_string(ch_b));
}

std::vector<std::string> ColocalizationResult::row() const
{
	std::vector<std::string> res;
	res.push_back(group);
	res.push_back(sample);
	res.push_back(fmt_value(coefficient(CH_CORE, CH_ER)));
	res.push_back(fmt_value(coefficient(CH_CORE, CH_LDS)));
	int ids[] = {CH_ER, CH_CORE, CH_LDS};
	for (int id : ids) {
		const Channel& ch = channel_of(channels, id);
		res.push_back(fmt_value(ch.max));
		res.push_back(fmt_value(ch.threshold));
	}
	return res;
}

//----------------------------- ColocalizationAnalyzer ------------------------

ColocalizationAnalyzer::ColocalizationAnalyzer()
{
	pairs.push_back(std::make_pair(CH_CORE, CH_ER));
	pairs.push_back(std::make_pair(CH_CORE, CH_LDS));
}

ColocalizationResult ColocalizationAnalyzer::analyze(const std::string& group, const std::string& sample,
		const ChannelSet& channels, const VolumeSet& volumes) const
{
	ColocalizationResult res;
	res.group = group;
	res.sample = sample;
	res.channels = channels;
	for (const std::pair<int, int>& pr : pairs) {
		const Channel& cha = channel_of(channels, pr.first);
		const Channel& chb = channel_of(channels, pr.second);
		PairCoefficient pc = overlap_coefficients(volume_of(volumes, pr.first), volume_of(volumes, pr.second),
				cha.threshold, chb.threshold);
		pc.ch_a = pr.first;
		pc.ch_b = pr.second;
		res.pairs.push_back(pc);
	}
	return res;
}
