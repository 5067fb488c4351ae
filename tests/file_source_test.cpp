#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "common/file_source.hpp"
#include "test_transport.hpp"

using namespace ferry;

TEST(FileSourceTest, MimeGuessFromExtension) {
    EXPECT_EQ(mime_for_path("notes.TXT"), "text/plain");
    EXPECT_EQ(mime_for_path("photo.jpeg"), "image/jpeg");
    EXPECT_EQ(mime_for_path("archive.tar.gz"), "application/gzip");
    EXPECT_EQ(mime_for_path("blob"), "application/octet-stream");
}

TEST(FileSourceTest, MemoryFileDefaultsAndReads) {
    MemoryFile file(ferry::testing::pattern_bytes(10), "");
    EXPECT_EQ(file.name(), "file.bin");
    EXPECT_EQ(file.mime(), "application/octet-stream");
    EXPECT_EQ(file.size(), 10u);

    auto part = file.read(4, 3);
    ASSERT_TRUE(part.has_value());
    auto all = ferry::testing::pattern_bytes(10);
    EXPECT_EQ(*part, Bytes(all.begin() + 4, all.begin() + 7));

    auto past_end = file.read(8, 5);
    ASSERT_FALSE(past_end.has_value());
    EXPECT_EQ(past_end.error(), TransferError::ReadFailed);
}

TEST(FileSourceTest, DiskFileReadsRanges) {
    auto dir = std::filesystem::temp_directory_path() / "ferry_file_source_test";
    std::filesystem::create_directories(dir);
    auto path = dir / "data.bin";
    auto bytes = ferry::testing::pattern_bytes(3000);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    auto file = DiskFile::open(path);
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ((*file)->name(), "data.bin");
    EXPECT_EQ((*file)->size(), 3000u);

    auto tail = (*file)->read(2048, 952);
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(*tail, Bytes(bytes.begin() + 2048, bytes.end()));

    // Seeking back after hitting the end still works
    auto head = (*file)->read(0, 16);
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(*head, Bytes(bytes.begin(), bytes.begin() + 16));

    std::filesystem::remove_all(dir);
}

TEST(FileSourceTest, DiskFileRejectsDirectoriesAndMissingPaths) {
    auto dir = std::filesystem::temp_directory_path();
    auto as_dir = DiskFile::open(dir);
    ASSERT_FALSE(as_dir.has_value());
    EXPECT_EQ(as_dir.error(), TransferError::InvalidInput);

    EXPECT_FALSE(DiskFile::open(dir / "ferry_definitely_missing.bin").has_value());
}

TEST(FileSourceTest, DiskFileFromOpenStream) {
    auto dir = std::filesystem::temp_directory_path() / "ferry_file_stream_test";
    std::filesystem::create_directories(dir);
    auto path = dir / "notes.txt";
    auto bytes = ferry::testing::pattern_bytes(100);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    std::ifstream in(path, std::ios::binary);
    ASSERT_TRUE(in.is_open());
    auto file = std::make_unique<DiskFile>(std::move(in), "notes.txt", "text/plain", 100);
    EXPECT_EQ(file->mime(), "text/plain");

    auto part = file->read(90, 10);
    ASSERT_TRUE(part.has_value());
    EXPECT_EQ(*part, Bytes(bytes.begin() + 90, bytes.end()));
    EXPECT_FALSE(file->read(95, 10).has_value());

    std::filesystem::remove_all(dir);
}
