#ifndef coloc_h
#define coloc_h

#include "channels.h"

// Thresholded Manders'-style overlap of one ordered channel pair.
// The joint set is the voxels where A > threshold_a and B > threshold_b;
// m_a is the share of A's above-threshold intensity inside the joint set, m_b likewise for B.
struct PairCoefficient
{
	int ch_a, ch_b;
	double m_a, m_b;
	long long joint_voxels;
};

PairCoefficient overlap_coefficients(const unsigned short *a, const unsigned short *b, long long n,
		double threshold_a, double threshold_b);
PairCoefficient overlap_coefficients(const VoxelVolume& va, const VoxelVolume& vb,
		double threshold_a, double threshold_b);

struct ColocalizationResult
{
	std::string group;
	std::string sample;
	std::vector<PairCoefficient> pairs;
	ChannelSet channels;		// threshold/max context the coefficients were computed with
	// Coefficient of the first channel of the pair (a, b); throws std::out_of_range if not computed
	double coefficient(int ch_a, int ch_b) const;
	// Report row: group, sample, Core/ER, Core/LDs, ER max, ER thr, Core max, Core thr, LDs max, LDs thr
	std::vector<std::string> row() const;
};

class ColocalizationAnalyzer
{
protected:
	std::vector<std::pair<int, int>> pairs;
public:
	// Core/ER and Core/LDs
	ColocalizationAnalyzer();
	ColocalizationAnalyzer(const std::vector<std::pair<int, int>>& _pairs) : pairs(_pairs) {}
	ColocalizationResult analyze(const std::string& group, const std::string& sample,
			const ChannelSet& channels, const VolumeSet& volumes) const;
};

#endif
