#ifndef batch_h
#define batch_h

#include "coloc.h"
#include "datasets.h"
#include "platform.h"
#include "stats.h"
#include "threshold.h"
#include "volcoloc.h"

// Stage selection and parameters of one batch run
struct AnalysisParams
{
	bool do_thresholds;
	bool do_colocalization;
	bool do_surfaces;
	bool do_volume_colocalization;
	bool do_statistics;
	ThresholdParams thresholds;
	StdConvention std_conv;
	AnalysisParams() :
		do_thresholds(false), do_colocalization(false), do_surfaces(false),
		do_volume_colocalization(false), do_statistics(false),
		std_conv(STD_SAMPLE) {}
	// All stages on, default parameters
	static AnalysisParams all_stages();
};

struct BatchResults
{
	std::vector<ColocalizationResult> coloc;
	std::vector<SampleStatistics> stats;
	std::vector<std::string> failed;	// samples whose processing raised an exception
};

class BatchAnalysis
{
protected:
	ImagingPlatform& platform;
	AnalysisParams params;
	std::ostream& log;
	//
	ChannelSet channels_from_platform();
	void run_surfaces(const ChannelSet& channels);
	void run_volume_colocalization(const ChannelSet& channels);
	bool run_statistics(const DatasetRef& ds, BatchResults& res);
public:
	BatchAnalysis(ImagingPlatform& _platform, const AnalysisParams& _params, std::ostream& _log=std::cout);
	// Process every dataset in turn. A dataset raising an exception (AnalysisError
	// or a platform error) is closed without saving, listed in BatchResults::failed,
	// and the batch continues.
	BatchResults run(const std::vector<DatasetRef>& datasets);
	// All enabled stages for one dataset; errors propagate
	void process(const DatasetRef& ds, BatchResults& res);
};

#endif
