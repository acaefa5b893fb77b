#include "test_base.hpp"
#include "core/file_utils.hpp"
#include <algorithm>

class FileUtilsTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();

        // Create test directory structure
        fs::create_directories(pathIn("subdir1"));
        fs::create_directories(pathIn("subdir2"));

        writeFile(pathIn("file2.txt"), "two");
        writeFile(pathIn("file1.txt"), "one");
        writeFile(pathIn("subdir1/file3.txt"), "three");
        writeFile(pathIn("subdir2/file4.txt"), "four");
    }
};

TEST_F(FileUtilsTest, ListFilesNonRecursive)
{
    std::vector<std::string> files;
    bool completed = false;
    bool error_occurred = false;

    auto observable = FileUtils::listFilesAsObservable(testDir(), false);
    observable.subscribe(
        [&files](const std::string &file_path)
        {
            files.push_back(file_path);
        },
        [&error_occurred](const std::exception &e)
        {
            error_occurred = true;
            FAIL() << "Unexpected error in file listing: " << e.what();
        },
        [&completed]()
        {
            completed = true;
        });

    // Only the two files in the root directory
    EXPECT_EQ(files.size(), 2u);
    EXPECT_TRUE(completed);
    EXPECT_FALSE(error_occurred);
}

TEST_F(FileUtilsTest, ListFilesRecursive)
{
    std::vector<std::string> files;
    bool completed = false;

    FileUtils::listFilesAsObservable(testDir(), true)
        .subscribe([&files](const std::string &file_path)
                   { files.push_back(file_path); },
                   [&completed]()
                   { completed = true; });

    EXPECT_EQ(files.size(), 4u);
    EXPECT_TRUE(completed);
    EXPECT_TRUE(std::any_of(files.begin(), files.end(), [](const std::string &f)
                            { return f.find("file4.txt") != std::string::npos; }));
}

TEST_F(FileUtilsTest, ListFilesIsSorted)
{
    auto files = FileUtils::listFiles(testDir(), false);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], pathIn("file1.txt"));
    EXPECT_EQ(files[1], pathIn("file2.txt"));
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
}

TEST_F(FileUtilsTest, InvalidDirectory)
{
    bool error_received = false;
    std::string error_message;

    auto observable = FileUtils::listFilesAsObservable(pathIn("nonexistent_dir"), false);
    observable.subscribe(
        [](const std::string &)
        {
            FAIL() << "Should not receive any files for invalid directory";
        },
        [&error_received, &error_message](const std::exception &e)
        {
            error_received = true;
            error_message = e.what();
        },
        []()
        {
            FAIL() << "Should not complete successfully for invalid directory";
        });

    EXPECT_TRUE(error_received);
    EXPECT_NE(error_message.find("Invalid directory path"), std::string::npos);
    EXPECT_TRUE(FileUtils::listFiles(pathIn("nonexistent_dir")).empty());
    EXPECT_FALSE(FileUtils::isValidDirectory(pathIn("file1.txt")));
    EXPECT_TRUE(FileUtils::isValidDirectory(testDir()));
}

TEST_F(FileUtilsTest, ReadFileBytes)
{
    auto content = FileUtils::readFileBytes(pathIn("subdir1/file3.txt"));
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(toString(*content), "three");
    EXPECT_FALSE(FileUtils::readFileBytes(pathIn("missing.bin")).has_value());
}

TEST_F(FileUtilsTest, WriteFileAtomicallyLeavesOnlyTarget)
{
    std::vector<uint8_t> data = {1, 2, 3, 4, 5};
    std::string target = pathIn("out/data.bin");
    fs::create_directories(pathIn("out"));

    std::string error;
    ASSERT_TRUE(FileUtils::writeFileAtomically(target, data, &error)) << error;
    EXPECT_EQ(FileUtils::readFileBytes(target).value_or(std::vector<uint8_t>()), data);
    EXPECT_EQ(countFiles(pathIn("out")), 1u);

    // Replaces an existing file
    std::vector<uint8_t> replacement = {9};
    ASSERT_TRUE(FileUtils::writeFileAtomically(target, replacement));
    EXPECT_EQ(FileUtils::readFileBytes(target).value_or(std::vector<uint8_t>()), replacement);
    EXPECT_EQ(countFiles(pathIn("out")), 1u);
}

TEST_F(FileUtilsTest, WriteFileAtomicallyReportsFailure)
{
    std::string error;
    EXPECT_FALSE(FileUtils::writeFileAtomically(pathIn("file1.txt/child.bin"), {1}, &error));
    EXPECT_FALSE(error.empty());
}

TEST_F(FileUtilsTest, ComputeFileHash)
{
    writeFile(pathIn("abc.txt"), "abc");
    EXPECT_EQ(FileUtils::computeFileHash(pathIn("abc.txt")), "900150983CD24FB0D6963F7D28E17F72");
    EXPECT_EQ(FileUtils::computeFileHash(pathIn("missing.txt")), "");
}

TEST_F(FileUtilsTest, GetFileMetadata)
{
    auto metadata = FileUtils::getFileMetadata(pathIn("file1.txt"));
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->file_size, 3u);
    EXPECT_EQ(metadata->file_path, pathIn("file1.txt"));

    auto again = FileUtils::getFileMetadata(pathIn("file1.txt"));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->modification_time, metadata->modification_time);

    EXPECT_FALSE(FileUtils::getFileMetadata(pathIn("subdir1")).has_value());
    EXPECT_FALSE(FileUtils::getFileMetadata(pathIn("missing")).has_value());
}

TEST_F(FileUtilsTest, LowercaseExtension)
{
    EXPECT_EQ(FileUtils::lowercaseExtension("/a/b/PHOTO.JPG"), "jpg");
    EXPECT_EQ(FileUtils::lowercaseExtension("image.Tiff"), "tiff");
    EXPECT_EQ(FileUtils::lowercaseExtension("noext"), "");
}
