#pragma once

#include "tsvu/common/line-reader.h"
#include "tsvu/core/logger.h"
#include "tsvu/split/split-config.h"
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace tsvu::split {

/**
 * Output file name for block `number` in fixed-block mode
 *
 * Numbers are written as plain decimal, without padding: "part_0",
 * "part_1", ... "part_10".
 */
std::string
block_filename(
    const std::string& dir,
    const std::string& prefix,
    const std::string& suffix,
    std::uint64_t number);

struct FixedBlockOptions
{
    std::uint64_t lines_per_file = 0;
    std::string dir;
    std::string prefix;
    std::string suffix;
    HeaderMode header_mode = HeaderMode::NONE;
    bool append = false;
};

/**
 * Splits input into files of a fixed number of lines.
 *
 * Input is copied byte for byte from a reusable read buffer; lines are never
 * assembled in memory, so memory use does not depend on line length. Inputs
 * are logically concatenated: the line count of the current output file
 * carries over from one input to the next.
 *
 * The buffer logic is the state machine
 *
 *   EXPECTING_HEADER     -> first line of an input, with a header mode set
 *   COPYING_PARTIAL_LINE -> the last bytes copied did not end in '\n'
 *   AT_LINE_BOUNDARY     -> the last bytes copied ended a line
 *
 * Output is the same for every read chunk size.
 */
class FixedBlockSplitter
{
public:
    enum class State { EXPECTING_HEADER, COPYING_PARTIAL_LINE, AT_LINE_BOUNDARY };

    explicit FixedBlockSplitter(
        FixedBlockOptions options,
        std::size_t chunk_bytes = common::DEFAULT_READ_CHUNK_BYTES);

    ~FixedBlockSplitter();

    FixedBlockSplitter(const FixedBlockSplitter&) = delete;
    FixedBlockSplitter&
    operator=(const FixedBlockSplitter&) = delete;

    /**
     * Copy one whole input, chunk by chunk
     *
     * @throws InputFileError, PreexistingOutputError, OutputFileError
     */
    void
    split_stream(common::InputSource& input);

    /** Open `name` ("-" for standard input), split it, then close it */
    void
    split_file(const std::string& name);

    /** Start a new input; resets per-input header detection */
    void
    begin_input(const std::string& display_name);

    /** Feed the next bytes of the current input */
    void
    process_chunk(const char* data, std::size_t size);

    /**
     * End the current input
     *
     * Nothing is added to a final line without a terminator: the output
     * file stays open and the next input continues that line.
     */
    void
    end_input();

    /**
     * Close the current output file
     *
     * @throws OutputFileError if the close fails
     */
    void
    finish();

    State
    state() const
    {
        return state_;
    }

    /** Number of output files opened so far */
    std::uint64_t
    files_written() const
    {
        return files_written_;
    }

    /** Number of data lines copied so far */
    std::uint64_t
    lines_written() const
    {
        return lines_written_;
    }

    /** Captured header line, including its '\n'; empty if none */
    const std::string&
    header() const
    {
        return header_;
    }

private:
    FixedBlockOptions options_;
    std::vector<char> buffer_;
    State state_ = State::AT_LINE_BOUNDARY;
    std::string input_name_;

    std::string header_;
    bool header_captured_ = false;

    std::unique_ptr<std::ofstream> output_;
    std::string output_name_;
    std::uint64_t next_file_number_ = 0;
    std::uint64_t remaining_lines_ = 0;

    // The last bytes written did not end in '\n'
    bool line_open_ = false;

    std::uint64_t files_written_ = 0;
    std::uint64_t lines_written_ = 0;

    void
    open_next_output();

    void
    close_output();

    void
    write_output(const char* data, std::size_t size);

    // Consume header bytes; returns the offset just past the header line, or
    // `size` if the header continues in the next chunk
    std::size_t
    consume_header(const char* data, std::size_t size);

    // Copy data lines to the output files
    void
    copy_lines(const char* data, std::size_t size);
};

}  // namespace tsvu::split
