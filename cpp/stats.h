#ifndef stats_h
#define stats_h

#include <map>
#include "geom.h"

// Statistics are only extracted from scenes with more surfaces than this
// (4 channel surfaces + 2 colocalization surfaces).
const int MIN_SURFACE_COUNT = 5;

// Object populations of one sample, named like their surfaces
extern const char *const POP_LDS;
extern const char *const POP_ER;
extern const char *const POP_CORE;
extern const char *const POP_NUCLEUS;
extern const char *const POP_COLOC_CORE_LDS;
extern const char *const POP_COLOC_CORE_ER;

enum StdConvention
{
	STD_SAMPLE,			// divide by N-1; what the exported spreadsheets report
	STD_POPULATION		// divide by N
};

struct Summary
{
	long long count;
	double min, max, median, sum, mean, stdev;
};

// Throws InsufficientDataError on an empty array.
// Sample stdev of a single value is 0.
Summary summarize(const std::vector<double>& values, StdConvention conv=STD_SAMPLE);

// Per-object statistics of one segmented population
struct ObjectPopulation
{
	std::vector<double> volumes;
	std::vector<double> sphericities;
};

struct SampleObjects
{
	std::string group;
	std::string sample;
	int surface_count;		// surfaces present in the scene
	std::map<std::string, ObjectPopulation> populations;
	SampleObjects() : surface_count(0) {}
};

struct SampleStatistics
{
	std::string group;
	std::string sample;
	long long ld_count;
	double ld_vol_min, ld_vol_max, ld_vol_median, ld_vol_sum, ld_vol_stdev;
	double ld_sph_mean, ld_sph_stdev;
	double er_vol_sum, er_vol_stdev;
	double core_vol_sum, core_vol_stdev;
	double nucleus_vol_sum, nucleus_vol_stdev;
	double coloc_ld_vol_sum, coloc_er_vol_sum;
	// Per-object values, reported on their own next to the summary
	std::vector<double> ld_volumes;
	std::vector<double> ld_sphericities;
	// Flat record in report order, group first
	std::vector<std::string> row() const;
};

class StatisticsAggregator
{
protected:
	StdConvention conv;
public:
	StatisticsAggregator(StdConvention _conv=STD_SAMPLE) : conv(_conv) {}
	// Throws InsufficientDataError if surface_count <= MIN_SURFACE_COUNT,
	// or if an expected population is missing or has no objects.
	SampleStatistics aggregate(const SampleObjects& objs) const;
};

#endif
