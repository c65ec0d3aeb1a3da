#ifndef geom_h
#define geom_h

#include <stdio.h>
#include <stdlib.h>

#include <cmath>
#include <math.h>
#include <string.h>
#include <string>
#include <vector>
#include <algorithm>
#include <utility>
#include <iostream>

#ifndef uint64
typedef unsigned long long uint64;
#endif

const double GRID_EPS = 1e-9;

// Physical extent of a voxel grid, same units as the acquisition (usually um)
struct Extent3D
{
	double xmin, ymin, zmin, xmax, ymax, zmax;
	Extent3D() : xmin(0.), ymin(0.), zmin(0.), xmax(0.), ymax(0.), zmax(0.) {}
	Extent3D(double _xmin, double _ymin, double _zmin, double _xmax, double _ymax, double _zmax) :
		xmin(_xmin), ymin(_ymin), zmin(_zmin), xmax(_xmax), ymax(_ymax), zmax(_zmax) {}
	double sizeX() const { return xmax - xmin; }
	double sizeY() const { return ymax - ymin; }
	double sizeZ() const { return zmax - zmin; }
	bool equals(const Extent3D& other) const;
};

// Voxel counts plus physical extent.
// A default extent (all zeros) means "unit voxels": extent is taken as 0..w, 0..h, 0..d.
struct Grid3D
{
	int w, h, d;
	Extent3D ext;
	Grid3D() : w(0), h(0), d(0) {}
	Grid3D(int _w, int _h, int _d) : w(_w), h(_h), d(_d), ext(0., 0., 0., _w, _h, _d) {}
	Grid3D(int _w, int _h, int _d, const Extent3D& _ext) : w(_w), h(_h), d(_d), ext(_ext) {}
	long long numVoxels() const { return (long long)(w) * h * d; }
	double voxelSizeX() const { return w > 0 ? ext.sizeX() / w : 0.; }
	double voxelSizeY() const { return h > 0 ? ext.sizeY() / h : 0.; }
	double voxelSizeZ() const { return d > 0 ? ext.sizeZ() / d : 0.; }
	double voxelVolume() const { return voxelSizeX() * voxelSizeY() * voxelSizeZ(); }
	bool sameShape(const Grid3D& other) const {
		return w == other.w && h == other.h && d == other.d;
	}
	bool sameGrid(const Grid3D& other) const {
		return sameShape(other) && ext.equals(other.ext);
	}
	std::string describe() const;
};

#endif
