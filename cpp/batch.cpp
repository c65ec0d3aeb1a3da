#include "errors.h"
#include "batch.h"

AnalysisParams AnalysisParams::all_stages()
{
	AnalysisParams params;
	params.do_thresholds = true;
	params.do_colocalization = true;
	params.do_surfaces = true;
	params.do_volume_colocalization = true;
	params.do_statistics = true;
	return params;
}

// Load intensity volumes of all channels, once per dataset
static void load_volumes(ImagingPlatform& platform, const ChannelSet& channels,
		std::map<int, VoxelVolume>& vols, VolumeSet& vset)
{
	if (!vset.empty()) return;
	for (ChannelSet::const_iterator it = channels.begin(); it != channels.end(); ++it) {
		std::map<int, VoxelVolume>::iterator vit = vols.emplace(it->first, platform.channel_volume(it->first)).first;
		vset[it->first] = &vit->second;
	}
}

//----------------------------- BatchAnalysis ---------------------------------

BatchAnalysis::BatchAnalysis(ImagingPlatform& _platform, const AnalysisParams& _params, std::ostream& _log) :
		platform(_platform), params(_params), log(_log)
{
	params.thresholds.validate();
}

ChannelSet BatchAnalysis::channels_from_platform()
{
	ChannelSet channels = default_channels();
	for (ChannelSet::iterator it = channels.begin(); it != channels.end(); ++it)
		platform.channel_range(it->first, &it->second.threshold, &it->second.max);
	return channels;
}

void BatchAnalysis::run_surfaces(const ChannelSet& channels)
{
	platform.remove_surfaces();
	for (ChannelSet::const_iterator it = channels.begin(); it != channels.end(); ++it) {
		const Channel& ch = it->second;
		platform.detect_surfaces(ch, ch.surface_threshold(), SURFACE_SMOOTHING);
	}
}

void BatchAnalysis::run_volume_colocalization(const ChannelSet& channels)
{
	// Drop colocalization surfaces left over from a previous run
	platform.keep_surfaces(int(channels.size()));

	int pairs[2][2] = { {CH_CORE, CH_LDS}, {CH_CORE, CH_ER} };
	VolumeColocalizer vcol;
	for (int j=0; j<2; j++) {
		const Channel& cha = channel_of(channels, pairs[j][0]);
		const Channel& chb = channel_of(channels, pairs[j][1]);
		BinaryMask ma = platform.surface_mask(cha.name);
		BinaryMask mb = platform.surface_mask(chb.name);
		VolumeColocalization vc = vcol.colocalize(cha.name, ma, chb.name, mb);
		platform.add_mask_surface(vc);
	}
}

bool BatchAnalysis::run_statistics(const DatasetRef& ds, BatchResults& res)
{
	int nsurf = platform.surface_count();
	if (nsurf <= MIN_SURFACE_COUNT) {
		log << "skipped, " << nsurf << " surfaces" << std::endl;
		return false;
	}

	SampleObjects objs;
	objs.group = ds.group;
	objs.sample = ds.sample;
	objs.surface_count = nsurf;
	const char *names[] = { POP_LDS, POP_ER, POP_CORE, POP_NUCLEUS, POP_COLOC_CORE_LDS, POP_COLOC_CORE_ER };
	for (const char *name : names)
		objs.populations[name] = platform.object_statistics(name);

	// Empty populations (no Core-ER overlap, say) skip statistics for this sample
	StatisticsAggregator agg(params.std_conv);
	try {
		res.stats.push_back(agg.aggregate(objs));
	}
	catch (const InsufficientDataError& e) {
		log << "skipped, " << e.what() << std::endl;
		return false;
	}
	return true;
}

void BatchAnalysis::process(const DatasetRef& ds, BatchResults& res)
{
	platform.open(ds.path);

	ChannelSet channels = default_channels();
	std::map<int, VoxelVolume> vols;
	VolumeSet vset;

	if (params.do_thresholds) {
		log << "   Thresholding..." << std::flush;
		load_volumes(platform, channels, vols, vset);
		ThresholdEstimator est(params.thresholds);
		channels = est.estimate(channels, vset);
		for (ChannelSet::const_iterator it = channels.begin(); it != channels.end(); ++it)
			platform.set_channel_display(it->second);
		log << "done!" << std::endl;
	}

	if (params.do_colocalization) {
		log << "   Calculating colocalization..." << std::flush;
		load_volumes(platform, channels, vols, vset);
		ColocalizationAnalyzer an;
		res.coloc.push_back(an.analyze(ds.group, ds.sample, channels_from_platform(), vset));
		log << "done!" << std::endl;
	}

	if (params.do_surfaces) {
		log << "   Detecting surfaces..." << std::flush;
		run_surfaces(channels_from_platform());
		log << "done!" << std::endl;
	}

	if (params.do_volume_colocalization) {
		log << "   Calculating volumetric colocalization..." << std::flush;
		run_volume_colocalization(channels_from_platform());
		log << "done!" << std::endl;
	}

	if (params.do_statistics) {
		log << "   Exporting volume statistics..." << std::flush;
		if (run_statistics(ds, res))
			log << "done!" << std::endl;
	}

	platform.save_and_close();
}

BatchResults BatchAnalysis::run(const std::vector<DatasetRef>& datasets)
{
	BatchResults res;
	log << "Beginning analysis" << std::endl;
	for (size_t i=0; i<datasets.size(); i++) {
		const DatasetRef& ds = datasets[i];
		log << std::endl << "Analyzing file " << (i+1) << " of " << datasets.size() << ": " << ds.sample << std::endl;
		// Results of a dataset only count once all its stages went through
		BatchResults dsres;
		try {
			process(ds, dsres);
		}
		catch (const std::exception& e) {
			log << "failed: " << e.what() << std::endl;
			platform.close();
			res.failed.push_back(ds.sample);
			continue;
		}
		for (ColocalizationResult& cr : dsres.coloc)
			res.coloc.push_back(cr);
		for (SampleStatistics& st : dsres.stats)
			res.stats.push_back(st);
		log << "Complete" << std::endl;
	}
	log << "Analysis completed: " << (datasets.size() - res.failed.size()) << " of " <<
		datasets.size() << " datasets" << std::endl;
	return res;
}
