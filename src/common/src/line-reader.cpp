#include "tsvu/common/line-reader.h"
#include "tsvu/common/common-errors.h"

#include <cerrno>
#include <cstring>
#include <iostream>

namespace tsvu::common {

InputSource::InputSource(std::string name) : name_(std::move(name)), in_(nullptr)
{
    if (is_stdin())
    {
        in_ = &std::cin;
        return;
    }

    file_ = std::make_unique<std::ifstream>(name_, std::ios::binary);
    if (!file_->is_open())
    {
        throw InputFileError(
            "Cannot open input file: '" + name_ + "': " + std::strerror(errno),
            name_);
    }
    in_ = file_.get();
}

std::string
InputSource::display_name() const
{
    return is_stdin() ? std::string("Standard Input") : name_;
}

std::size_t
InputSource::read_chunk(char* buffer, std::size_t size)
{
    if (in_->eof())
        return 0;

    in_->read(buffer, static_cast<std::streamsize>(size));
    auto n = static_cast<std::size_t>(in_->gcount());

    if (in_->bad())
    {
        throw InputFileError(
            "Error reading input: '" + display_name() + "'", name_);
    }

    return n;
}

void
InputSource::close()
{
    if (file_)
    {
        file_->close();
    }
}

LineReader::LineReader(InputSource& source, std::size_t chunk_bytes)
    : source_(source), buffer_(chunk_bytes > 0 ? chunk_bytes : 1)
{
}

bool
LineReader::next_line(std::string_view& line)
{
    while (true)
    {
        if (scan_from_ < end_)
        {
            const char* base = buffer_.data();
            const void* nl =
                std::memchr(base + scan_from_, '\n', end_ - scan_from_);
            if (nl)
            {
                std::size_t nl_pos = static_cast<const char*>(nl) - base;
                line = std::string_view(base + begin_, nl_pos - begin_);
                begin_ = scan_from_ = nl_pos + 1;
                ++line_number_;
                return true;
            }
            scan_from_ = end_;
        }

        if (eof_)
        {
            if (begin_ < end_)
            {
                line = std::string_view(buffer_.data() + begin_, end_ - begin_);
                begin_ = scan_from_ = end_;
                ++line_number_;
                return true;
            }
            return false;
        }

        // Move the partial line to the front, growing if it fills the buffer
        if (begin_ > 0)
        {
            std::memmove(buffer_.data(), buffer_.data() + begin_, end_ - begin_);
            end_ -= begin_;
            scan_from_ -= begin_;
            begin_ = 0;
        }
        if (end_ == buffer_.size())
        {
            buffer_.resize(buffer_.size() * 2);
        }

        std::size_t n =
            source_.read_chunk(buffer_.data() + end_, buffer_.size() - end_);
        if (n == 0)
        {
            eof_ = true;
        }
        end_ += n;
    }
}

void
throw_if_windows_newline(
    std::string_view line,
    const std::string& source,
    std::uint64_t line_number)
{
    if (!line.empty() && line.back() == '\r')
    {
        throw InputFormatError(
            "Windows/DOS line ending found. Convert file to Unix newlines "
            "before processing (e.g. 'dos2unix').\n  File: " +
                source + ", Line: " + std::to_string(line_number),
            source,
            line_number);
    }
}

}  // namespace tsvu::common
