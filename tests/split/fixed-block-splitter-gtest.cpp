#include "split-test-utils.h"
#include "tsvu/split/fixed-block-splitter.h"
#include "tsvu/split/split-errors.h"
#include <string>
#include <vector>

using namespace tsvu::split;
namespace fs = boost::filesystem;

namespace {

const std::vector<std::size_t> CHUNK_SIZES = {
    1, 2, 3, 4, 5, 6, 7, 8, tsvu::common::DEFAULT_READ_CHUNK_BYTES};

}  // namespace

class FixedBlockSplitterTest : public test::TempDirTest
{
protected:
    FixedBlockOptions
    options_for(
        const fs::path& dir,
        std::uint64_t lines_per_file,
        HeaderMode header_mode = HeaderMode::NONE)
    {
        FixedBlockOptions options;
        options.lines_per_file = lines_per_file;
        options.dir = dir.string();
        options.prefix = "part_";
        options.header_mode = header_mode;
        return options;
    }

    fs::path
    fresh_dir(const std::string& name)
    {
        auto dir = test_dir_ / name;
        fs::create_directories(dir);
        return dir;
    }

    // Output file contents in numeric block order
    std::vector<std::string>
    outputs(const fs::path& dir, std::uint64_t count)
    {
        std::vector<std::string> contents;
        for (std::uint64_t i = 0; i < count; ++i)
        {
            contents.push_back(read_file(block_filename(dir.string(), "part_", "", i)));
        }
        return contents;
    }

    void
    run(const FixedBlockOptions& options,
        const std::vector<std::string>& inputs,
        std::size_t chunk_bytes)
    {
        FixedBlockSplitter splitter(options, chunk_bytes);
        for (const auto& input : inputs)
            splitter.split_file(input);
        splitter.finish();
    }
};

TEST_F(FixedBlockSplitterTest, BlockFilenamesAreNotPadded)
{
    EXPECT_EQ(block_filename("", "part_", "", 0), "part_0");
    EXPECT_EQ(block_filename("", "part_", ".tsv", 10), "part_10.tsv");
    EXPECT_EQ(block_filename("dir", "x", "", 3), "dir/x3");
}

TEST_F(FixedBlockSplitterTest, FiveLinesTwoPerFile)
{
    auto input = write_file("input.txt", "abcde\nfghij\nklmno\npqrst\nuvwxy\n");

    for (auto chunk : CHUNK_SIZES)
    {
        auto dir = fresh_dir("out_" + std::to_string(chunk));
        run(options_for(dir, 2), {input}, chunk);

        EXPECT_EQ(
            list_files(dir),
            std::vector<std::string>({"part_0", "part_1", "part_2"}))
            << "chunk size " << chunk;
        EXPECT_EQ(
            outputs(dir, 3),
            std::vector<std::string>(
                {"abcde\nfghij\n", "klmno\npqrst\n", "uvwxy\n"}))
            << "chunk size " << chunk;
    }
}

TEST_F(FixedBlockSplitterTest, ConcatenationReproducesInput)
{
    std::string content;
    for (int i = 0; i < 23; ++i)
    {
        const char fill = static_cast<char>('a' + i % 26);
        content += std::string(static_cast<std::size_t>(i % 7), fill) + "\t" +
            std::to_string(i) + "\n";
    }
    auto input = write_file("input.tsv", content);

    for (std::uint64_t k = 1; k <= 5; ++k)
    {
        for (auto chunk : CHUNK_SIZES)
        {
            auto dir = fresh_dir(
                "out_" + std::to_string(k) + "_" + std::to_string(chunk));
            FixedBlockSplitter splitter(options_for(dir, k), chunk);
            splitter.split_file(input);
            splitter.finish();

            const std::uint64_t expected_files = (23 + k - 1) / k;
            EXPECT_EQ(splitter.files_written(), expected_files);
            EXPECT_EQ(splitter.lines_written(), 23u);

            std::string joined;
            for (const auto& part : outputs(dir, expected_files))
                joined += part;
            EXPECT_EQ(joined, content) << "k " << k << " chunk " << chunk;
        }
    }
}

TEST_F(FixedBlockSplitterTest, HeaderWrittenToEveryFile)
{
    auto input = write_file(
        "input.tsv", "a_long_header_line\tcol2\nr1\nr2\nr3\n");

    for (auto chunk : CHUNK_SIZES)
    {
        auto dir = fresh_dir("out_" + std::to_string(chunk));
        run(options_for(dir, 2, HeaderMode::WRITE_TO_ALL), {input}, chunk);

        EXPECT_EQ(
            outputs(dir, 2),
            std::vector<std::string>(
                {"a_long_header_line\tcol2\nr1\nr2\n",
                 "a_long_header_line\tcol2\nr3\n"}))
            << "chunk size " << chunk;
    }
}

TEST_F(FixedBlockSplitterTest, HeaderInOnlyIsStripped)
{
    auto input = write_file("input.tsv", "header\nr1\nr2\nr3\n");

    for (auto chunk : CHUNK_SIZES)
    {
        auto dir = fresh_dir("out_" + std::to_string(chunk));
        run(options_for(dir, 2, HeaderMode::STRIP_ONLY), {input}, chunk);
        EXPECT_EQ(
            outputs(dir, 2),
            std::vector<std::string>({"r1\nr2\n", "r3\n"}))
            << "chunk size " << chunk;
    }
}

TEST_F(FixedBlockSplitterTest, MultipleInputsShareTheLineCount)
{
    auto first = write_file("first.tsv", "h\n1\n2\n3\n");
    auto second = write_file("second.tsv", "h-other\n4\n5\n");

    for (auto chunk : CHUNK_SIZES)
    {
        auto dir = fresh_dir("out_" + std::to_string(chunk));
        run(options_for(dir, 2, HeaderMode::WRITE_TO_ALL),
            {first, second},
            chunk);

        // The counter runs across inputs; later headers are dropped
        EXPECT_EQ(
            outputs(dir, 3),
            std::vector<std::string>({"h\n1\n2\n", "h\n3\n4\n", "h\n5\n"}))
            << "chunk size " << chunk;
    }
}

TEST_F(FixedBlockSplitterTest, EmptyFirstInputDefersHeader)
{
    auto empty = write_file("empty.tsv", "");
    auto data = write_file("data.tsv", "hdr\nx\n");

    auto dir = fresh_dir("out");
    FixedBlockSplitter splitter(
        options_for(dir, 10, HeaderMode::WRITE_TO_ALL), 3);
    splitter.split_file(empty);
    splitter.split_file(data);
    splitter.finish();

    EXPECT_EQ(splitter.header(), "hdr\n");
    EXPECT_EQ(read_file(block_filename(dir.string(), "part_", "", 0)), "hdr\nx\n");
}

TEST_F(FixedBlockSplitterTest, UnterminatedInputIsCopiedExactly)
{
    const std::string content = "abcde\nfghij\nklmno";
    auto input = write_file("input.txt", content);

    for (auto chunk : CHUNK_SIZES)
    {
        auto dir = fresh_dir("out_" + std::to_string(chunk));
        FixedBlockSplitter splitter(options_for(dir, 2), chunk);
        splitter.split_file(input);
        splitter.finish();

        EXPECT_EQ(splitter.files_written(), 2u) << "chunk size " << chunk;
        EXPECT_EQ(splitter.lines_written(), 3u) << "chunk size " << chunk;
        EXPECT_EQ(
            outputs(dir, 2),
            std::vector<std::string>({"abcde\nfghij\n", "klmno"}))
            << "chunk size " << chunk;
    }
}

TEST_F(FixedBlockSplitterTest, UnterminatedInputContinuesIntoNext)
{
    auto first = write_file("first.txt", "a\nb");
    auto second = write_file("second.txt", "c\nd");

    for (auto chunk : CHUNK_SIZES)
    {
        auto dir = fresh_dir("out_" + std::to_string(chunk));
        run(options_for(dir, 1), {first, second}, chunk);

        // Inputs are concatenated byte for byte: "b" and "c" form one line
        EXPECT_EQ(
            outputs(dir, 3),
            std::vector<std::string>({"a\n", "bc\n", "d"}))
            << "chunk size " << chunk;
        EXPECT_EQ(list_files(dir).size(), 3u) << "chunk size " << chunk;
    }
}

TEST_F(FixedBlockSplitterTest, StateMachineTransitions)
{
    auto dir = fresh_dir("out");
    FixedBlockSplitter splitter(options_for(dir, 5, HeaderMode::WRITE_TO_ALL));

    splitter.begin_input("chunks");
    EXPECT_EQ(splitter.state(), FixedBlockSplitter::State::EXPECTING_HEADER);

    splitter.process_chunk("hea", 3);
    EXPECT_EQ(splitter.state(), FixedBlockSplitter::State::EXPECTING_HEADER);

    splitter.process_chunk("d\nli", 4);
    EXPECT_EQ(splitter.state(), FixedBlockSplitter::State::COPYING_PARTIAL_LINE);
    EXPECT_EQ(splitter.header(), "head\n");

    splitter.process_chunk("ne\n", 3);
    EXPECT_EQ(splitter.state(), FixedBlockSplitter::State::AT_LINE_BOUNDARY);
    EXPECT_EQ(splitter.lines_written(), 1u);

    splitter.end_input();
    splitter.finish();
    EXPECT_EQ(
        read_file(block_filename(dir.string(), "part_", "", 0)),
        "head\nline\n");
}

TEST_F(FixedBlockSplitterTest, RefusesExistingOutput)
{
    auto input = write_file("input.txt", "1\n2\n3\n");
    auto dir = fresh_dir("out");
    write_file("out/part_1", "keep\n");

    try
    {
        run(options_for(dir, 2), {input}, 4);
        FAIL() << "Expected PreexistingOutputError";
    }
    catch (const PreexistingOutputError& e)
    {
        EXPECT_EQ(e.path(), block_filename(dir.string(), "part_", "", 1));
        EXPECT_NE(
            std::string(e.what()).find("Output file already exists"),
            std::string::npos);
    }

    // Files before the conflict stay; the conflicting file is untouched
    EXPECT_EQ(read_file(block_filename(dir.string(), "part_", "", 0)), "1\n2\n");
    EXPECT_EQ(read_file(block_filename(dir.string(), "part_", "", 1)), "keep\n");
}

TEST_F(FixedBlockSplitterTest, AppendDoesNotRepeatHeader)
{
    auto input = write_file("input.tsv", "h\n1\n2\n");
    auto dir = fresh_dir("out");

    auto options = options_for(dir, 5, HeaderMode::WRITE_TO_ALL);
    options.append = true;
    run(options, {input}, 3);
    run(options, {input}, 3);

    EXPECT_EQ(
        read_file(block_filename(dir.string(), "part_", "", 0)),
        "h\n1\n2\n1\n2\n");
}

TEST_F(FixedBlockSplitterTest, MissingInput)
{
    auto dir = fresh_dir("out");
    FixedBlockSplitter splitter(options_for(dir, 2));
    EXPECT_THROW(
        splitter.split_file(path_of("missing.txt")),
        tsvu::common::InputFileError);
}
