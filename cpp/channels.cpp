#include <stdexcept>
#include "errors.h"
#include "channels.h"

ChannelSet default_channels()
{
	ChannelSet channels;
	channels[CH_ER] = Channel(CH_ER, "ER", 255);
	channels[CH_CORE] = Channel(CH_CORE, "Core", 65535);
	channels[CH_LDS] = Channel(CH_LDS, "LDs", 65280);
	channels[CH_NUCLEUS] = Channel(CH_NUCLEUS, "Nucleus", 16711680);
	return channels;
}

const Channel& channel_of(const ChannelSet& channels, int id)
{
	ChannelSet::const_iterator it = channels.find(id);
	if (it == channels.end())
		throw std::out_of_range("no channel " + std::to_string(id));
	return it->second;
}

const VoxelVolume& volume_of(const VolumeSet& volumes, int id)
{
	VolumeSet::const_iterator it = volumes.find(id);
	if (it == volumes.end() || !it->second)
		throw EmptyInputError("no intensity data for channel " + std::to_string(id));
	return *it->second;
}
