#ifndef volcoloc_h
#define volcoloc_h

#include "raster.h"

// Voxel-wise intersection of two surface masks on the same grid:
// voxels inside both objects become 1, everything else 0.
// Throws ShapeMismatchError if the grids differ in voxel counts or physical extent.
BinaryMask colocalize_masks(const BinaryMask& m1, const BinaryMask& m2);

// "Volume Colocalization <A>-<B>"
std::string colocalization_channel_name(const std::string& name_a, const std::string& name_b);

// Intersection mask plus what the imaging platform needs to turn it into a surface
struct VolumeColocalization
{
	BinaryMask mask;
	std::string channel_name;
	int range_min, range_max;	// display range of the new channel, always 0..1
	double smoothing;			// surface smoothing for the new channel, 2 voxels
	long long voxels;
	double volume;
	VolumeColocalization(BinaryMask&& _mask) : mask(std::move(_mask)),
		range_min(0), range_max(1), smoothing(0.), voxels(0), volume(0.) {}
};

class VolumeColocalizer
{
public:
	VolumeColocalization colocalize(const std::string& name_a, const BinaryMask& mask_a,
			const std::string& name_b, const BinaryMask& mask_b) const;
};

#endif
