#include <sstream>
#include "errors.h"
#include "stats.h"

const char *const POP_LDS = "LDs";
const char *const POP_ER = "ER";
const char *const POP_CORE = "Core";
const char *const POP_NUCLEUS = "Nucleus";
const char *const POP_COLOC_CORE_LDS = "Volume Colocalization Core-LDs";
const char *const POP_COLOC_CORE_ER = "Volume Colocalization Core-ER";

Summary summarize(const std::vector<double>& values, StdConvention conv)
{
	if (values.empty())
		throw InsufficientDataError("statistics: empty value array");

	Summary res;
	res.count = (long long)(values.size());
	res.min = *std::min_element(values.begin(), values.end());
	res.max = *std::max_element(values.begin(), values.end());
	res.sum = 0.;
	for (double v : values) res.sum += v;
	res.mean = res.sum / res.count;

	std::vector<double> sorted(values);
	std::sort(sorted.begin(), sorted.end());
	size_t mid = sorted.size() / 2;
	res.median = (sorted.size() % 2) ? sorted[mid] : (sorted[mid-1] + sorted[mid]) / 2.;

	double sumsq = 0.;
	for (double v : values) {
		double dv = v - res.mean;
		sumsq += dv*dv;
	}
	long long dof = (conv == STD_SAMPLE) ? res.count - 1 : res.count;
	res.stdev = (dof > 0) ? sqrt(sumsq / dof) : 0.;
	return res;
}

//----------------------------- SampleStatistics ------------------------------

std::vector<std::string> SampleStatistics::row() const
{
	std::vector<std::string> res;
	res.push_back(group);
	res.push_back(sample);
	double vals[] = {
		double(ld_count),
		ld_vol_min, ld_vol_max, ld_vol_median, ld_vol_sum, ld_vol_stdev,
		ld_sph_mean, ld_sph_stdev,
		er_vol_sum, er_vol_stdev,
		core_vol_sum, core_vol_stdev,
		nucleus_vol_sum, nucleus_vol_stdev,
		coloc_ld_vol_sum, coloc_er_vol_sum
	};
	for (double v : vals) {
		std::ostringstream ss;
		ss << v;
		res.push_back(ss.str());
	}
	return res;
}

//----------------------------- StatisticsAggregator --------------------------

static const ObjectPopulation& population(const SampleObjects& objs, const char *name)
{
	std::map<std::string, ObjectPopulation>::const_iterator it = objs.populations.find(name);
	if (it == objs.populations.end())
		throw InsufficientDataError(objs.sample + ": no " + name + " surfaces");
	if (it->second.volumes.empty())
		throw InsufficientDataError(objs.sample + ": " + name + " population has no objects");
	return it->second;
}

SampleStatistics StatisticsAggregator::aggregate(const SampleObjects& objs) const
{
	if (objs.surface_count <= MIN_SURFACE_COUNT) {
		std::ostringstream ss;
		ss << objs.sample << ": " << objs.surface_count << " surfaces, statistics need more than " <<
			MIN_SURFACE_COUNT;
		throw InsufficientDataError(ss.str());
	}

	const ObjectPopulation& lds = population(objs, POP_LDS);
	if (lds.sphericities.empty())
		throw InsufficientDataError(objs.sample + ": no " + POP_LDS + " sphericities");
	Summary ldvol = summarize(lds.volumes, conv);
	Summary ldsph = summarize(lds.sphericities, conv);
	Summary er = summarize(population(objs, POP_ER).volumes, conv);
	Summary core = summarize(population(objs, POP_CORE).volumes, conv);
	Summary nuc = summarize(population(objs, POP_NUCLEUS).volumes, conv);
	Summary cld = summarize(population(objs, POP_COLOC_CORE_LDS).volumes, conv);
	Summary cer = summarize(population(objs, POP_COLOC_CORE_ER).volumes, conv);

	SampleStatistics res;
	res.group = objs.group;
	res.sample = objs.sample;
	res.ld_count = ldvol.count;
	res.ld_vol_min = ldvol.min;
	res.ld_vol_max = ldvol.max;
	res.ld_vol_median = ldvol.median;
	res.ld_vol_sum = ldvol.sum;
	res.ld_vol_stdev = ldvol.stdev;
	res.ld_sph_mean = ldsph.mean;
	res.ld_sph_stdev = ldsph.stdev;
	res.er_vol_sum = er.sum;
	res.er_vol_stdev = er.stdev;
	res.core_vol_sum = core.sum;
	res.core_vol_stdev = core.stdev;
	res.nucleus_vol_sum = nuc.sum;
	res.nucleus_vol_stdev = nuc.stdev;
	res.coloc_ld_vol_sum = cld.sum;
	res.coloc_er_vol_sum = cer.sum;
	res.ld_volumes = lds.volumes;
	res.ld_sphericities = lds.sphericities;
	return res;
}
