#ifndef fixtures_h
#define fixtures_h

#include <stdlib.h>
#include <vector>

// Samples are kept within 0..255 with one saturated voxel at 255,
// so the joint histogram bin of every value below 255 equals the value itself.

// Two clusters in joint intensity space: a diamond of radius 15 around (20,20) for
// background, another around (150,150) for signal, plus one saturated voxel.
// Cells near a cluster centre repeat more often, which binarization must ignore.
inline void make_bimodal_pair(std::vector<unsigned short>& a, std::vector<unsigned short>& b)
{
	a.clear();
	b.clear();
	int centers[] = {20, 150};
	for (int k=0; k<2; k++) {
		int c0 = centers[k];
		for (int r=c0-15; r<=c0+15; r++) {
			for (int c=c0-15; c<=c0+15; c++) {
				int dist = abs(r-c0) + abs(c-c0);
				if (dist > 15) continue;
				int reps = 1 + (15 - dist);
				for (int j=0; j<reps; j++) {
					a.push_back((unsigned short)r);
					b.push_back((unsigned short)c);
				}
			}
		}
	}
	a.push_back(255);
	b.push_back(255);
}

// Row occupancy 1+r rising to a peak at row 30 (cells in columns 150..180),
// column occupancy 1+c rising to a peak at column 45 (cells in rows 160..205).
inline void make_peaks_30_45(std::vector<unsigned short>& a, std::vector<unsigned short>& b)
{
	a.clear();
	b.clear();
	for (int r=0; r<=60; r++) {
		int n = 31 - abs(r-30);
		for (int j=0; j<n; j++) {
			a.push_back((unsigned short)r);
			b.push_back((unsigned short)(150 + j));
		}
	}
	for (int c=0; c<=90; c++) {
		int n = 46 - abs(c-45);
		for (int j=0; j<n; j++) {
			a.push_back((unsigned short)(160 + j));
			b.push_back((unsigned short)c);
		}
	}
	a.push_back(255);
	b.push_back(255);
}

// Row r (0..60) holds 31-|r-30| cells in columns 0.., so the row profile has its mode at
// intensity 30 and the column profile is highest at 0. Intensities are multiplied by scale.
// Without a saturated voxel the histogram axis spans the observed maximum (60*scale),
// so bin index and intensity no longer coincide.
inline void make_mode_30_ramp(std::vector<unsigned short>& a, std::vector<unsigned short>& b, int scale)
{
	a.clear();
	b.clear();
	for (int r=0; r<=60; r++) {
		int n = 31 - abs(r-30);
		for (int j=0; j<n; j++) {
			a.push_back((unsigned short)(r * scale));
			b.push_back((unsigned short)(j * scale));
		}
	}
}

#endif
