#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

#include "errors.h"
#include "batch.h"
#include "fixtures.h"

// In-memory imaging platform: one line of voxels per channel, Core and ER share
// the first fixture channel, LDs and Nucleus the second. Surfaces are plain
// threshold masks; opening the path "bad" yields a dataset without voxels.
class FakePlatform : public ImagingPlatform
{
public:
	std::vector<unsigned short> a, b;
	bool empty;
	int opened, saved, closed;
	std::map<int, Channel> display;
	std::vector<std::string> surfaces;
	std::map<std::string, std::vector<unsigned char>> masks;
	std::map<std::string, double> smoothing;
	//
	FakePlatform() : empty(false), opened(0), saved(0), closed(0) {
		make_bimodal_pair(a, b);
	}
	Grid3D grid() const { return Grid3D(empty ? 0 : int(a.size()), 1, 1); }
	std::vector<unsigned short>& data(int channel) {
		return (channel == CH_CORE || channel == CH_ER) ? a : b;
	}

	void open(const std::string& path) {
		++opened;
		empty = (path == "bad");
		display.clear();
		surfaces.clear();
		masks.clear();
	}
	void save_and_close() { ++saved; }
	void close() { ++closed; }

	VoxelVolume channel_volume(int channel) {
		return VoxelVolume(grid(), data(channel).data());
	}
	void channel_range(int channel, double *p_min, double *p_max) {
		const Channel& ch = display[channel];
		*p_min = ch.threshold;
		*p_max = ch.max;
	}
	void set_channel_display(const Channel& ch) { display[ch.id] = ch; }

	int surface_count() { return int(surfaces.size()); }
	void remove_surfaces() {
		surfaces.clear();
		masks.clear();
	}
	void keep_surfaces(int nkeep) {
		while (int(surfaces.size()) > nkeep) {
			masks.erase(surfaces.back());
			surfaces.pop_back();
		}
	}
	void detect_surfaces(const Channel& ch, double threshold, double smooth) {
		Grid3D g = grid();
		std::vector<unsigned short>& vals = data(ch.id);
		std::vector<unsigned char> m(size_t(g.numVoxels()), 0);
		for (size_t i=0; i<m.size(); i++)
			m[i] = vals[i] > threshold ? 1 : 0;
		surfaces.push_back(ch.name);
		masks[ch.name] = m;
		smoothing[ch.name] = smooth;
	}
	BinaryMask surface_mask(const std::string& name) {
		std::map<std::string, std::vector<unsigned char>>::iterator it = masks.find(name);
		if (it == masks.end())
			throw EmptyInputError("no surface " + name);
		BinaryMask res(grid());
		memcpy(res.buf, it->second.data(), it->second.size());
		return res;
	}
	void add_mask_surface(const VolumeColocalization& vc) {
		surfaces.push_back(vc.channel_name);
		masks[vc.channel_name].assign(vc.mask.buf, vc.mask.buf + vc.mask.len);
		smoothing[vc.channel_name] = vc.smoothing;
	}
	ObjectPopulation object_statistics(const std::string& name) {
		ObjectPopulation pop;
		if (name == "LDs") {
			for (int i=1; i<=5; i++) {
				pop.volumes.push_back(double(i));
				pop.sphericities.push_back(0.5 + 0.1 * i);
			}
		} else {
			long long n = 0;
			for (unsigned char v : masks[name]) n += v;
			pop.volumes.push_back(double(n));
		}
		return pop;
	}
};

TEST(BatchAnalysis, AllStages)
{
	FakePlatform platform;
	std::ostringstream log;
	BatchAnalysis batch(platform, AnalysisParams::all_stages(), log);
	std::vector<DatasetRef> datasets;
	datasets.push_back(DatasetRef("HCV", "cell01", "cell01.ims"));
	BatchResults res = batch.run(datasets);

	EXPECT_TRUE(res.failed.empty());
	EXPECT_EQ(1, platform.saved);
	EXPECT_EQ(0, platform.closed);

	// Bimodal pair thresholds for Core/LDs, 15% of max for the others
	EXPECT_DOUBLE_EQ(40., platform.display[CH_CORE].threshold);
	EXPECT_DOUBLE_EQ(40., platform.display[CH_LDS].threshold);
	EXPECT_DOUBLE_EQ(38.25, platform.display[CH_ER].threshold);
	EXPECT_DOUBLE_EQ(38.25, platform.display[CH_NUCLEUS].threshold);
	EXPECT_DOUBLE_EQ(255., platform.display[CH_ER].max);

	ASSERT_EQ(1u, res.coloc.size());
	EXPECT_EQ("cell01", res.coloc[0].sample);
	EXPECT_DOUBLE_EQ(1., res.coloc[0].coefficient(CH_CORE, CH_ER));
	EXPECT_DOUBLE_EQ(1., res.coloc[0].coefficient(CH_CORE, CH_LDS));

	ASSERT_EQ(6u, platform.surfaces.size());
	EXPECT_EQ("Volume Colocalization Core-LDs", platform.surfaces[4]);
	EXPECT_EQ("Volume Colocalization Core-ER", platform.surfaces[5]);
	EXPECT_DOUBLE_EQ(SURFACE_SMOOTHING, platform.smoothing["Core"]);
	EXPECT_DOUBLE_EQ(2., platform.smoothing["Volume Colocalization Core-LDs"]);

	ASSERT_EQ(1u, res.stats.size());
	EXPECT_EQ("HCV", res.stats[0].group);
	EXPECT_EQ(5, res.stats[0].ld_count);
	EXPECT_DOUBLE_EQ(15., res.stats[0].ld_vol_sum);

	std::string out = log.str();
	EXPECT_NE(std::string::npos, out.find("Beginning analysis"));
	EXPECT_NE(std::string::npos, out.find("Analyzing file 1 of 1: cell01"));
	EXPECT_NE(std::string::npos, out.find("Thresholding...done!"));
	EXPECT_NE(std::string::npos, out.find("Complete"));
	EXPECT_NE(std::string::npos, out.find("Analysis completed: 1 of 1 datasets"));
}

TEST(BatchAnalysis, FailedDatasetDoesNotStopBatch)
{
	FakePlatform platform;
	std::ostringstream log;
	BatchAnalysis batch(platform, AnalysisParams::all_stages(), log);
	std::vector<DatasetRef> datasets;
	datasets.push_back(DatasetRef("HCV", "s1", "s1.ims"));
	datasets.push_back(DatasetRef("HCV", "s2", "bad"));
	datasets.push_back(DatasetRef("Mock", "s3", "s3.ims"));
	BatchResults res = batch.run(datasets);

	ASSERT_EQ(1u, res.failed.size());
	EXPECT_EQ("s2", res.failed[0]);
	EXPECT_EQ(3, platform.opened);
	EXPECT_EQ(2, platform.saved);
	EXPECT_EQ(1, platform.closed);
	ASSERT_EQ(2u, res.coloc.size());
	EXPECT_EQ("s1", res.coloc[0].sample);
	EXPECT_EQ("s3", res.coloc[1].sample);
	EXPECT_EQ("Mock", res.coloc[1].group);
	EXPECT_EQ(2u, res.stats.size());

	std::string out = log.str();
	EXPECT_NE(std::string::npos, out.find("failed: "));
	EXPECT_NE(std::string::npos, out.find("Analysis completed: 2 of 3 datasets"));
}

// Opening the path "missing" fails in the platform itself
class MissingFilePlatform : public FakePlatform
{
public:
	void open(const std::string& path) {
		if (path == "missing")
			throw std::runtime_error("cannot open " + path);
		FakePlatform::open(path);
	}
};

TEST(BatchAnalysis, PlatformErrorDoesNotStopBatch)
{
	MissingFilePlatform platform;
	std::ostringstream log;
	BatchAnalysis batch(platform, AnalysisParams::all_stages(), log);
	std::vector<DatasetRef> datasets;
	datasets.push_back(DatasetRef("HCV", "s1", "s1.ims"));
	datasets.push_back(DatasetRef("HCV", "s2", "missing"));
	datasets.push_back(DatasetRef("HCV", "s3", "s3.ims"));
	BatchResults res;
	ASSERT_NO_THROW(res = batch.run(datasets));

	ASSERT_EQ(1u, res.failed.size());
	EXPECT_EQ("s2", res.failed[0]);
	EXPECT_EQ(2, platform.opened);
	EXPECT_EQ(2, platform.saved);
	EXPECT_EQ(1, platform.closed);
	ASSERT_EQ(2u, res.coloc.size());
	EXPECT_EQ("s1", res.coloc[0].sample);
	EXPECT_EQ("s3", res.coloc[1].sample);
	EXPECT_EQ(2u, res.stats.size());
	EXPECT_NE(std::string::npos, log.str().find("failed: cannot open missing"));
}

// No Core-ER overlap: the colocalization surface has no objects
class NoOverlapPlatform : public FakePlatform
{
public:
	ObjectPopulation object_statistics(const std::string& name) {
		if (name == POP_COLOC_CORE_ER)
			return ObjectPopulation();
		return FakePlatform::object_statistics(name);
	}
};

TEST(BatchAnalysis, EmptyPopulationKeepsEarlierStages)
{
	NoOverlapPlatform platform;
	std::ostringstream log;
	BatchAnalysis batch(platform, AnalysisParams::all_stages(), log);
	std::vector<DatasetRef> datasets;
	datasets.push_back(DatasetRef("HCV", "s1", "s1.ims"));
	BatchResults res = batch.run(datasets);

	EXPECT_TRUE(res.failed.empty());
	EXPECT_EQ(1u, res.coloc.size());
	EXPECT_TRUE(res.stats.empty());
	EXPECT_EQ(1, platform.saved);
	EXPECT_EQ(0, platform.closed);
	EXPECT_EQ(6u, platform.surfaces.size());
	EXPECT_DOUBLE_EQ(40., platform.display[CH_CORE].threshold);
	EXPECT_NE(std::string::npos, log.str().find("skipped, "));
	EXPECT_NE(std::string::npos, log.str().find("Analysis completed: 1 of 1 datasets"));
}

TEST(BatchAnalysis, StatisticsSkippedWithoutColocalizationSurfaces)
{
	FakePlatform platform;
	std::ostringstream log;
	AnalysisParams params;
	params.do_statistics = true;
	BatchAnalysis batch(platform, params, log);
	std::vector<DatasetRef> datasets;
	datasets.push_back(DatasetRef("HCV", "s1", "s1.ims"));
	BatchResults res = batch.run(datasets);

	EXPECT_TRUE(res.failed.empty());
	EXPECT_TRUE(res.stats.empty());
	EXPECT_EQ(1, platform.saved);
	EXPECT_NE(std::string::npos, log.str().find("skipped, 0 surfaces"));
}

TEST(BatchAnalysis, StagesOff)
{
	FakePlatform platform;
	std::ostringstream log;
	BatchAnalysis batch(platform, AnalysisParams(), log);
	std::vector<DatasetRef> datasets;
	datasets.push_back(DatasetRef("HCV", "s1", "s1.ims"));
	BatchResults res = batch.run(datasets);
	EXPECT_TRUE(res.coloc.empty());
	EXPECT_TRUE(platform.display.empty());
	EXPECT_TRUE(platform.surfaces.empty());
	EXPECT_EQ(1, platform.saved);
}
