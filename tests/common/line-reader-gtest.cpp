#include "tsvu/common/common-errors.h"
#include "tsvu/common/line-reader.h"
#include <boost/filesystem.hpp>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace tsvu::common;
namespace fs = boost::filesystem;

class LineReaderTest : public ::testing::Test
{
protected:
    fs::path test_dir_;

    void
    SetUp() override
    {
        test_dir_ = fs::temp_directory_path() /
            fs::unique_path("line_reader_test_%%%%-%%%%");
        fs::create_directories(test_dir_);
    }

    void
    TearDown() override
    {
        fs::remove_all(test_dir_);
    }

    std::string
    write_file(const std::string& name, const std::string& content)
    {
        auto path = (test_dir_ / name).string();
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::vector<std::string>
    read_all(const std::string& path, std::size_t chunk_bytes)
    {
        InputSource source(path);
        LineReader reader(source, chunk_bytes);
        std::vector<std::string> lines;
        std::string_view line;
        while (reader.next_line(line))
        {
            lines.emplace_back(line);
            EXPECT_EQ(reader.line_number(), lines.size());
        }
        return lines;
    }
};

TEST_F(LineReaderTest, SameLinesForEveryChunkSize)
{
    auto path = write_file(
        "input.tsv", "first\tline\n\nthird line is longer than most\nlast\n");
    const std::vector<std::string> expected = {
        "first\tline", "", "third line is longer than most", "last"};

    for (std::size_t chunk = 1; chunk <= 8; ++chunk)
    {
        EXPECT_EQ(read_all(path, chunk), expected) << "chunk size " << chunk;
    }
    EXPECT_EQ(read_all(path, DEFAULT_READ_CHUNK_BYTES), expected);
}

TEST_F(LineReaderTest, FinalLineWithoutNewline)
{
    auto path = write_file("input.txt", "a\nb");
    for (std::size_t chunk : {1u, 2u, 3u, 64u})
    {
        EXPECT_EQ(read_all(path, chunk), std::vector<std::string>({"a", "b"}));
    }
}

TEST_F(LineReaderTest, EmptyFile)
{
    auto path = write_file("empty.txt", "");
    EXPECT_TRUE(read_all(path, 4).empty());
}

TEST_F(LineReaderTest, MissingFile)
{
    auto path = (test_dir_ / "does-not-exist.txt").string();
    try
    {
        InputSource source(path);
        FAIL() << "Expected InputFileError";
    }
    catch (const InputFileError& e)
    {
        EXPECT_EQ(e.path(), path);
        EXPECT_NE(
            std::string(e.what()).find("Cannot open input file"),
            std::string::npos);
    }
}

TEST_F(LineReaderTest, StandardInputNames)
{
    InputSource source("-");
    EXPECT_TRUE(source.is_stdin());
    EXPECT_EQ(source.name(), "-");
    EXPECT_EQ(source.display_name(), "Standard Input");
    // Closing standard input is a no-op
    source.close();
}

TEST(WindowsNewline, DetectsCarriageReturn)
{
    EXPECT_NO_THROW(throw_if_windows_newline("a\tb", "file.tsv", 1));
    EXPECT_NO_THROW(throw_if_windows_newline("", "file.tsv", 1));

    try
    {
        throw_if_windows_newline("a\tb\r", "file.tsv", 1);
        FAIL() << "Expected InputFormatError";
    }
    catch (const InputFormatError& e)
    {
        EXPECT_EQ(e.source(), "file.tsv");
        EXPECT_EQ(e.line_number(), 1u);
        EXPECT_NE(
            std::string(e.what()).find("Windows/DOS line ending"),
            std::string::npos);
    }
}
