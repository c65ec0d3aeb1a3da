#include <sstream>
#include "errors.h"
#include "volcoloc.h"

BinaryMask colocalize_masks(const BinaryMask& m1, const BinaryMask& m2)
{
	Grid3D g1 = m1.getGrid();
	Grid3D g2 = m2.getGrid();
	if (!g1.sameGrid(g2)) {
		std::ostringstream ss;
		ss << "volume colocalization: masks are on different grids, " <<
			g1.describe() << " vs " << g2.describe();
		throw ShapeMismatchError(ss.str());
	}

	BinaryMask res(g1, NULL);
	for (long long i=0; i<res.len; i++) {
		int sum = (m1.buf[i] ? 1 : 0) + (m2.buf[i] ? 1 : 0);
		res.buf[i] = (sum >= 2) ? 1 : 0;
	}
	return res;
}

std::string colocalization_channel_name(const std::string& name_a, const std::string& name_b)
{
	return "Volume Colocalization " + name_a + "-" + name_b;
}

VolumeColocalization VolumeColocalizer::colocalize(const std::string& name_a, const BinaryMask& mask_a,
		const std::string& name_b, const BinaryMask& mask_b) const
{
	VolumeColocalization res(colocalize_masks(mask_a, mask_b));
	res.channel_name = colocalization_channel_name(name_a, name_b);
	res.smoothing = res.mask.getGrid().voxelSizeX() * 2.;
	res.voxels = res.mask.count();
	res.volume = res.mask.volume();
	return res;
}
