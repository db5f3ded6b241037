#include "tsvu/split/fixed-block-splitter.h"
#include "tsvu/split/split-errors.h"

#include <boost/filesystem.hpp>
#include <cerrno>
#include <cstring>
#include <utility>

namespace fs = boost::filesystem;
namespace tsvu::split {

std::string
block_filename(
    const std::string& dir,
    const std::string& prefix,
    const std::string& suffix,
    std::uint64_t number)
{
    std::string name = prefix + std::to_string(number) + suffix;
    if (dir.empty())
        return name;
    return (fs::path(dir) / name).string();
}

FixedBlockSplitter::FixedBlockSplitter(
    FixedBlockOptions options,
    std::size_t chunk_bytes)
    : options_(std::move(options)), buffer_(chunk_bytes == 0 ? 1 : chunk_bytes)
{
    if (options_.lines_per_file == 0)
    {
        throw SplitError("Lines per file must be greater than zero");
    }
}

FixedBlockSplitter::~FixedBlockSplitter()
{
    if (output_)
    {
        output_->close();
        if (output_->fail())
        {
            LOGE("Error closing output file: '", output_name_, "'");
        }
    }
}

void
FixedBlockSplitter::split_stream(common::InputSource& input)
{
    begin_input(input.display_name());

    std::size_t n;
    while ((n = input.read_chunk(buffer_.data(), buffer_.size())) > 0)
    {
        process_chunk(buffer_.data(), n);
    }

    end_input();
}

void
FixedBlockSplitter::split_file(const std::string& name)
{
    common::InputSource input(name);
    split_stream(input);
    input.close();
}

void
FixedBlockSplitter::begin_input(const std::string& display_name)
{
    input_name_ = display_name;
    state_ = options_.header_mode == HeaderMode::NONE ? State::AT_LINE_BOUNDARY
                                                      : State::EXPECTING_HEADER;
}

void
FixedBlockSplitter::process_chunk(const char* data, std::size_t size)
{
    std::size_t pos = 0;
    if (state_ == State::EXPECTING_HEADER)
    {
        pos = consume_header(data, size);
    }

    if (pos < size)
    {
        copy_lines(data + pos, size - pos);
    }
}

void
FixedBlockSplitter::end_input()
{
    switch (state_)
    {
        case State::EXPECTING_HEADER:
            // Header without a terminator; an empty input leaves the header
            // to be taken from the next one
            if (!header_captured_ && !header_.empty())
            {
                header_.push_back('\n');
                header_captured_ = true;
            }
            state_ = State::AT_LINE_BOUNDARY;
            break;

        case State::COPYING_PARTIAL_LINE:
            // Inputs are concatenated as is; the next input's first bytes
            // continue this line in the same output file
            break;

        case State::AT_LINE_BOUNDARY:
            break;
    }

    LOGD("Finished input: ", input_name_);
}

void
FixedBlockSplitter::finish()
{
    // An unterminated last line still counts as a line
    if (line_open_)
    {
        ++lines_written_;
        line_open_ = false;
    }

    if (output_)
    {
        close_output();
    }
}

std::size_t
FixedBlockSplitter::consume_header(const char* data, std::size_t size)
{
    // Only the first header seen is kept, and only when it is written out
    const bool keep =
        !header_captured_ && options_.header_mode == HeaderMode::WRITE_TO_ALL;

    const void* newline = std::memchr(data, '\n', size);
    if (newline == nullptr)
    {
        if (keep)
            header_.append(data, size);
        return size;
    }

    std::size_t end = static_cast<const char*>(newline) - data + 1;
    if (keep)
    {
        header_.append(data, end);
        header_captured_ = true;
    }
    state_ = State::AT_LINE_BOUNDARY;
    return end;
}

void
FixedBlockSplitter::copy_lines(const char* data, std::size_t size)
{
    std::size_t start = 0;
    while (start < size)
    {
        if (!output_)
        {
            open_next_output();
        }

        // Scan for terminators until this file is full or the chunk runs out
        std::size_t end = start;
        bool at_boundary = false;
        while (remaining_lines_ > 0 && end < size)
        {
            const void* newline = std::memchr(data + end, '\n', size - end);
            if (newline == nullptr)
            {
                end = size;
                at_boundary = false;
                break;
            }
            end = static_cast<const char*>(newline) - data + 1;
            at_boundary = true;
            --remaining_lines_;
            ++lines_written_;
        }

        write_output(data + start, end - start);
        line_open_ = !at_boundary;
        state_ = at_boundary ? State::AT_LINE_BOUNDARY
                             : State::COPYING_PARTIAL_LINE;

        if (remaining_lines_ == 0)
        {
            close_output();
        }

        start = end;
    }
}

void
FixedBlockSplitter::open_next_output()
{
    output_name_ = block_filename(
        options_.dir, options_.prefix, options_.suffix, next_file_number_);

    boost::system::error_code ec;
    if (!options_.append && fs::exists(output_name_, ec))
    {
        throw PreexistingOutputError(
            "Output file already exists. Use '--a|append' to append to "
            "existing files. File: '" +
                output_name_ + "'.",
            output_name_);
    }

    auto size = fs::file_size(output_name_, ec);
    const bool empty = ec || size == 0;

    output_ = std::make_unique<std::ofstream>(
        output_name_, std::ios::binary | std::ios::app);
    if (!output_->is_open())
    {
        std::string reason = std::strerror(errno);
        output_.reset();
        throw OutputFileError(
            "Cannot open output file: '" + output_name_ + "': " + reason,
            output_name_);
    }

    ++next_file_number_;
    ++files_written_;
    remaining_lines_ = options_.lines_per_file;
    LOGD("Opened ", output_name_);

    if (options_.header_mode == HeaderMode::WRITE_TO_ALL && empty)
    {
        write_output(header_.data(), header_.size());
    }
}

void
FixedBlockSplitter::close_output()
{
    output_->close();
    bool failed = output_->fail();
    output_.reset();
    if (failed)
    {
        throw OutputFileError(
            "Error closing output file: '" + output_name_ + "'", output_name_);
    }
}

void
FixedBlockSplitter::write_output(const char* data, std::size_t size)
{
    output_->write(data, static_cast<std::streamsize>(size));
    if (!*output_)
    {
        throw OutputFileError(
            "Error writing output file: '" + output_name_ + "'", output_name_);
    }
}

}  // namespace tsvu::split
