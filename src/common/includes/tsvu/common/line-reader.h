#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tsvu::common {

/** Name used on the command line for standard input */
inline constexpr std::string_view STDIN_NAME = "-";

/** Default read size for chunked input, shared by the line-oriented tools */
inline constexpr std::size_t DEFAULT_READ_CHUNK_BYTES = 512 * 1024;

/**
 * An opened input: a named file or standard input ("-").
 *
 * Owns the file stream; standard input is borrowed and never closed.
 */
class InputSource
{
public:
    /**
     * Open an input for binary reading
     *
     * @param name A file path, or "-" for standard input
     * @throws InputFileError if the file cannot be opened
     */
    explicit InputSource(std::string name);

    InputSource(const InputSource&) = delete;
    InputSource&
    operator=(const InputSource&) = delete;

    std::istream&
    stream()
    {
        return *in_;
    }

    /** The name as given ("-" for standard input) */
    const std::string&
    name() const
    {
        return name_;
    }

    /** The name as shown in diagnostics */
    std::string
    display_name() const;

    bool
    is_stdin() const
    {
        return name_ == STDIN_NAME;
    }

    /**
     * Read up to `size` bytes into `buffer`
     *
     * @return Bytes read; 0 only at end of input
     * @throws InputFileError on a read error
     */
    std::size_t
    read_chunk(char* buffer, std::size_t size);

    /** Release the file handle early; a no-op for standard input */
    void
    close();

private:
    std::string name_;
    std::unique_ptr<std::ifstream> file_;
    std::istream* in_;
};

/**
 * Chunk-buffered line reader.
 *
 * Lines are returned without their '\n'. A final line lacking a terminator is
 * still returned. Memory is bounded by the read chunk size plus the longest
 * line. Returned views stay valid until the next call to next_line.
 */
class LineReader
{
public:
    explicit LineReader(
        InputSource& source,
        std::size_t chunk_bytes = DEFAULT_READ_CHUNK_BYTES);

    /**
     * Advance to the next line
     *
     * @param line Receives the line, without terminator
     * @return false at end of input
     * @throws InputFileError on a read error
     */
    bool
    next_line(std::string_view& line);

    /** 1-based number of the line last returned, 0 before the first */
    std::uint64_t
    line_number() const
    {
        return line_number_;
    }

private:
    InputSource& source_;
    std::vector<char> buffer_;
    std::size_t begin_ = 0;
    std::size_t scan_from_ = 0;
    std::size_t end_ = 0;
    bool eof_ = false;
    std::uint64_t line_number_ = 0;
};

/**
 * Reject input with Windows/DOS line endings.
 *
 * @param line A line with its '\n' already removed
 * @param source Input name as shown to the user
 * @param line_number 1-based line number, for the message
 * @throws InputFormatError if the line ends in '\r'
 */
void
throw_if_windows_newline(
    std::string_view line,
    const std::string& source,
    std::uint64_t line_number);

}  // namespace tsvu::common
