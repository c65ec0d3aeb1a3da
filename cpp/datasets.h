#ifndef datasets_h
#define datasets_h

#include "geom.h"

// Dataset file extension of the imaging platform
const char *const DATASET_EXT = ".ims";

struct DatasetRef
{
	std::string group;		// usually the folder the dataset was found in
	std::string sample;
	std::string path;
	DatasetRef() {}
	DatasetRef(const std::string& _group, const std::string& _sample, const std::string& _path) :
		group(_group), sample(_sample), path(_path) {}
};

// Datasets directly in folder, then those in each immediate subfolder (no deeper).
// Group is the name of the containing folder, sample the file name without extension.
// Entries are sorted by name within a folder. Throws std::runtime_error if folder can't be read.
std::vector<DatasetRef> find_datasets(const std::string& folder);

#endif
