#include <sstream>
#include "geom.h"

static bool near_equal(double a, double b)
{
	double scale = std::max(1., std::max(fabs(a), fabs(b)));
	return fabs(a - b) <= GRID_EPS * scale;
}

//----------------------------- Extent3D --------------------------------------

bool Extent3D::equals(const Extent3D& other) const
{
	return near_equal(xmin, other.xmin) && near_equal(xmax, other.xmax) &&
		near_equal(ymin, other.ymin) && near_equal(ymax, other.ymax) &&
		near_equal(zmin, other.zmin) && near_equal(zmax, other.zmax);
}

//----------------------------- Grid3D ----------------------------------------

std::string Grid3D::describe() const
{
	std::ostringstream ss;
	ss << w << "x" << h << "x" << d << " [" <<
		ext.xmin << ".." << ext.xmax << ", " <<
		ext.ymin << ".." << ext.ymax << ", " <<
		ext.zmin << ".." << ext.zmax << "]";
	return ss.str();
}
