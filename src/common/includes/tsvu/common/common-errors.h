#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace tsvu::common {

// Base exception for all tsv-utils errors
class TsvuError : public std::runtime_error
{
public:
    explicit TsvuError(const std::string& msg) : std::runtime_error(msg)
    {
    }
};

// Malformed field list (e.g. "1,,2" or "3-")
class FieldListError : public TsvuError
{
public:
    explicit FieldListError(const std::string& msg) : TsvuError(msg)
    {
    }
};

// An input file could not be opened or read
class InputFileError : public TsvuError
{
public:
    InputFileError(const std::string& msg, std::string path)
        : TsvuError(msg), path_(std::move(path))
    {
    }

    const std::string&
    path() const
    {
        return path_;
    }

private:
    std::string path_;
};

// Input content the tools refuse to process (Windows line endings)
class InputFormatError : public TsvuError
{
public:
    InputFormatError(
        const std::string& msg,
        std::string source,
        std::uint64_t line_number)
        : TsvuError(msg), source_(std::move(source)), line_number_(line_number)
    {
    }

    const std::string&
    source() const
    {
        return source_;
    }

    std::uint64_t
    line_number() const
    {
        return line_number_;
    }

private:
    std::string source_;
    std::uint64_t line_number_;
};

}  // namespace tsvu::common
