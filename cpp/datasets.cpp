#include <dirent.h>
#include <sys/stat.h>
#include <stdexcept>
#include "datasets.h"

static bool is_directory(const std::string& path)
{
	struct stat st;
	if (stat(path.c_str(), &st) != 0) return false;
	return S_ISDIR(st.st_mode);
}

static bool has_ext(const std::string& name, const std::string& ext)
{
	return name.size() > ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
}

static std::string base_name(const std::string& path)
{
	std::string p = path;
	while (p.size() > 1 && p[p.size()-1] == '/')
		p.erase(p.size()-1);
	size_t pos = p.rfind('/');
	return (pos == std::string::npos) ? p : p.substr(pos+1);
}

static std::vector<std::string> list_folder(const std::string& folder)
{
	DIR *dir = opendir(folder.c_str());
	if (!dir)
		throw std::runtime_error("cannot open folder " + folder);
	std::vector<std::string> names;
	struct dirent *ent = NULL;
	while ((ent = readdir(dir)) != NULL) {
		if (!strcmp(ent->d_name, ".") || !strcmp(ent->d_name, ".."))
			continue;
		names.push_back(ent->d_name);
	}
	closedir(dir);
	std::sort(names.begin(), names.end());
	return names;
}

static void add_folder_datasets(const std::string& folder, const std::vector<std::string>& names,
		std::vector<DatasetRef>& res)
{
	std::string group = base_name(folder);
	std::string ext(DATASET_EXT);
	for (const std::string& name : names) {
		std::string path = folder + "/" + name;
		if (!has_ext(name, ext) || is_directory(path)) continue;
		res.push_back(DatasetRef(group, name.substr(0, name.size() - ext.size()), path));
	}
}

std::vector<DatasetRef> find_datasets(const std::string& folder)
{
	std::vector<DatasetRef> res;
	std::vector<std::string> names = list_folder(folder);
	add_folder_datasets(folder, names, res);

	for (const std::string& name : names) {
		std::string sub = folder + "/" + name;
		if (!is_directory(sub)) continue;
		add_folder_datasets(sub, list_folder(sub), res);
	}
	return res;
}
