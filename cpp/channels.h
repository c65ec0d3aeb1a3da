#ifndef channels_h
#define channels_h

#include <map>
#include "raster.h"

// Channel identities of the 4-channel HCV acquisition
const int CH_ER = 1;
const int CH_CORE = 2;
const int CH_LDS = 3;
const int CH_NUCLEUS = 4;

// Surfaces are detected at this fraction of the channel's display maximum
const double SURFACE_THRESHOLD_FRACTION = 0.15;
// Surface smoothing (um) used for the channel surfaces
const double SURFACE_SMOOTHING = 0.093;

struct Channel
{
	int id;
	std::string name;
	unsigned int color;		// packed RGBA as the imaging platform expects it
	double threshold;
	double max;
	Channel() : id(0), color(0), threshold(0.), max(0.) {}
	Channel(int _id, const std::string& _name, unsigned int _color) :
		id(_id), name(_name), color(_color), threshold(0.), max(0.) {}
	double surface_threshold() const { return max * SURFACE_THRESHOLD_FRACTION; }
};

// Channel records keyed by channel identity
typedef std::map<int, Channel> ChannelSet;

// Raw intensity volumes of one dataset keyed by channel identity; not owned
typedef std::map<int, const VoxelVolume*> VolumeSet;

// ER, Core, LDs, Nucleus with their display colors; thresholds and max are zero.
ChannelSet default_channels();

// Throws std::out_of_range naming the channel if it is not in the set
const Channel& channel_of(const ChannelSet& channels, int id);

// Throws EmptyInputError if the dataset has no volume for the channel
const VoxelVolume& volume_of(const VolumeSet& volumes, int id);

#endif
