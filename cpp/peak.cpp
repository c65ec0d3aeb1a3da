#include "errors.h"
#include "peak.h"

int find_first_peak(const std::vector<uint64>& profile)
{
	const int wsz = 2 * PEAK_HALF_WIDTH + 1;
	int n = int(profile.size());

	// Zero padding on both ends lets every candidate use a full window
	std::vector<uint64> padded(size_t(n) + 2 * PEAK_HALF_WIDTH, 0);
	std::copy(profile.begin(), profile.end(), padded.begin() + PEAK_HALF_WIDTH);

	for (int i=0; i<n; i++) {
		const uint64 *win = &padded[i];
		uint64 wmax = *std::max_element(win, win + wsz);
		if (win[PEAK_HALF_WIDTH] == wmax)
			return i;
	}

	throw NoPeakFoundError("peak search: no local maximum in a profile of " +
		std::to_string(n) + " values");
}
