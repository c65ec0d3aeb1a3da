#include "raster.h"

unsigned short max_sample(const unsigned short *buf, long long len)
{
	unsigned short mx = 0;
	for (long long i=0; i<len; i++)
		if (mx < buf[i]) mx = buf[i];
	return mx;
}

//----------------------------- VoxelVolume -----------------------------------

VoxelVolume::VoxelVolume(const Grid3D& grid, unsigned short *_buf) :
		w(grid.w), h(grid.h), d(grid.d), ext(grid.ext), buf(_buf)
{
	plane_len = (long long)(w) * h;
	len = plane_len * d;
	if (!buf) {
		storage.assign(size_t(len), 0);
		buf = storage.data();
	}
}

//----------------------------- BinaryMask ------------------------------------

BinaryMask::BinaryMask(const Grid3D& grid, unsigned char *_buf) :
		w(grid.w), h(grid.h), d(grid.d), ext(grid.ext), buf(_buf)
{
	plane_len = (long long)(w) * h;
	len = plane_len * d;
	if (!buf) {
		storage.assign(size_t(len), 0);
		buf = storage.data();
	}
}

long long BinaryMask::count() const
{
	long long cnt = 0;
	for (long long i=0; i<len; i++)
		if (buf[i] != 0) ++cnt;
	return cnt;
}
