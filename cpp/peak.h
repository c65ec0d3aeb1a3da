#ifndef peak_h
#define peak_h

#include "geom.h"

// Sliding window half-width; the window is 2*PEAK_HALF_WIDTH+1 = 25 values wide.
const int PEAK_HALF_WIDTH = 12;

// Index (0-based, into profile) of the first value which is the maximum of
// the window centred on it. Values beyond either end of the profile count as 0.
// Scans left to right, first match wins, so ties resolve to the earliest index.
// Throws NoPeakFoundError if no index qualifies (e.g. an empty profile).
int find_first_peak(const std::vector<uint64>& profile);

#endif
