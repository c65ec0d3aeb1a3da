#include <gtest/gtest.h>
#include <stdexcept>
#include <stdio.h>
#include <unistd.h>
#include <sys/stat.h>

#include "datasets.h"

// Scratch folder tree under /tmp, removed again at the end of each test
class DatasetFolder : public ::testing::Test
{
protected:
	std::string root;
	std::vector<std::string> files;
	std::vector<std::string> dirs;
	//
	void SetUp() {
		char tmpl[] = "/tmp/hcvcolocXXXXXX";
		char *p = mkdtemp(tmpl);
		ASSERT_TRUE(p != NULL);
		root = p;
	}
	void TearDown() {
		for (size_t i=files.size(); i>0; i--)
			remove(files[i-1].c_str());
		for (size_t i=dirs.size(); i>0; i--)
			rmdir(dirs[i-1].c_str());
		rmdir(root.c_str());
	}
	void add_dir(const std::string& rel) {
		std::string path = root + "/" + rel;
		ASSERT_EQ(0, mkdir(path.c_str(), 0700));
		dirs.push_back(path);
	}
	void add_file(const std::string& rel) {
		std::string path = root + "/" + rel;
		FILE *f = fopen(path.c_str(), "w");
		ASSERT_TRUE(f != NULL);
		fclose(f);
		files.push_back(path);
	}
};

TEST_F(DatasetFolder, RootAndOneLevelOfSubfolders)
{
	add_file("cell02.ims");
	add_file("notes.txt");
	add_dir("Mock");
	add_file("Mock/m2.ims");
	add_file("Mock/m1.ims");
	add_dir("HCV");
	add_file("HCV/h1.ims");
	add_dir("HCV/deeper");
	add_file("HCV/deeper/ignored.ims");
	add_dir("Empty");

	std::vector<DatasetRef> ds = find_datasets(root);
	ASSERT_EQ(4u, ds.size());

	std::string root_name = root.substr(root.rfind('/') + 1);
	EXPECT_EQ(root_name, ds[0].group);
	EXPECT_EQ("cell02", ds[0].sample);
	EXPECT_EQ(root + "/cell02.ims", ds[0].path);

	EXPECT_EQ("HCV", ds[1].group);
	EXPECT_EQ("h1", ds[1].sample);
	EXPECT_EQ(root + "/HCV/h1.ims", ds[1].path);

	EXPECT_EQ("Mock", ds[2].group);
	EXPECT_EQ("m1", ds[2].sample);
	EXPECT_EQ("Mock", ds[3].group);
	EXPECT_EQ("m2", ds[3].sample);
}

TEST_F(DatasetFolder, NoDatasets)
{
	add_file("readme.txt");
	add_file(".ims");
	add_dir("sub.ims");
	EXPECT_TRUE(find_datasets(root).empty());
}

TEST_F(DatasetFolder, MissingFolder)
{
	EXPECT_THROW(find_datasets(root + "/nowhere"), std::runtime_error);
}
