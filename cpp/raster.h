#ifndef raster_h
#define raster_h

#include "geom.h"

// Highest value in a 16-bit sample array, 0 if empty
unsigned short max_sample(const unsigned short *buf, long long len);

// 16-bit intensity samples of one channel, stored plane by plane (z, y, x).
// Wraps a caller-supplied buffer if one is given, otherwise owns its storage.
class VoxelVolume
{
public:
	int w, h, d;
	Extent3D ext;
	unsigned short *buf;
	long long len;
	long long plane_len;
	//
	VoxelVolume(const Grid3D& grid, unsigned short *_buf=NULL);
	VoxelVolume(VoxelVolume&& other) = default;
	VoxelVolume(const VoxelVolume&) = delete;
	VoxelVolume& operator=(const VoxelVolume&) = delete;
	//
	Grid3D getGrid() const { return Grid3D(w, h, d, ext); }
	void fill(unsigned short c) {
		for (long long i=0; i<len; i++) buf[i] = c;
	}
	unsigned short value(int x, int y, int z) const { return *(buf +(plane_len*z + (long long)(w)*y + x)); }
	void setValue(int x, int y, int z, unsigned short c) {
		*(buf +(plane_len*z + (long long)(w)*y + x)) = c;
	}
	unsigned short maxValue() const { return max_sample(buf, len); }
private:
	std::vector<unsigned short> storage;
};

// Voxel membership in a segmented 3D object: 0 = outside, 1 = inside.
// Any non-zero value is treated as inside.
class BinaryMask
{
public:
	int w, h, d;
	Extent3D ext;
	unsigned char *buf;
	long long len;
	long long plane_len;
	//
	BinaryMask(const Grid3D& grid, unsigned char *_buf=NULL);
	BinaryMask(BinaryMask&& other) = default;
	BinaryMask(const BinaryMask&) = delete;
	BinaryMask& operator=(const BinaryMask&) = delete;
	//
	Grid3D getGrid() const { return Grid3D(w, h, d, ext); }
	void fill(unsigned char c) { memset(buf, c, len); }
	unsigned char value(int x, int y, int z) const { return *(buf +(plane_len*z + (long long)(w)*y + x)); }
	void setValue(int x, int y, int z, unsigned char c) {
		*(buf +(plane_len*z + (long long)(w)*y + x)) = c;
	}
	// Number of voxels inside the object
	long long count() const;
	// count() scaled by the physical voxel volume
	double volume() const { return double(count()) * getGrid().voxelVolume(); }
private:
	std::vector<unsigned char> storage;
};

#endif
