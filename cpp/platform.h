#ifndef platform_h
#define platform_h

#include "channels.h"
#include "stats.h"
#include "volcoloc.h"

// The imaging application holding the open dataset: it loads and saves the data,
// segments surfaces and computes per-object statistics.
// The analysis core only talks to it through this interface.
class ImagingPlatform
{
public:
	virtual ~ImagingPlatform() {}
	virtual void open(const std::string& path) = 0;
	virtual void save_and_close() = 0;
	// Drop the dataset without saving
	virtual void close() = 0;

	// Raw intensities of one channel, with the dataset grid
	virtual VoxelVolume channel_volume(int channel) = 0;
	// Current display range of a channel
	virtual void channel_range(int channel, double *p_min, double *p_max) = 0;
	// Set display range (threshold..max), name and color of a channel
	virtual void set_channel_display(const Channel& ch) = 0;

	virtual int surface_count() = 0;
	virtual void remove_surfaces() = 0;
	// Remove surfaces beyond the first nkeep
	virtual void keep_surfaces(int nkeep) = 0;
	// Segment a surface named after the channel
	virtual void detect_surfaces(const Channel& ch, double threshold, double smoothing) = 0;
	// Mask of a named surface on the dataset grid
	virtual BinaryMask surface_mask(const std::string& name) = 0;
	// Add the mask as a new channel and segment it into a surface of the same name
	virtual void add_mask_surface(const VolumeColocalization& vc) = 0;
	// Per-object volumes and sphericities of a named surface
	virtual ObjectPopulation object_statistics(const std::string& name) = 0;
};

#endif
