#pragma once

#include "tsvu/common/common-errors.h"
#include <cstdint>
#include <string>
#include <utility>

namespace tsvu::split {

// Base exception for tsv-split errors
class SplitError : public common::TsvuError
{
public:
    explicit SplitError(const std::string& msg) : common::TsvuError(msg)
    {
    }
};

// Contradictory or invalid options; raised before any output is produced
class ConfigurationError : public SplitError
{
public:
    explicit ConfigurationError(const std::string& msg) : SplitError(msg)
    {
    }
};

// An output file exists and --append was not given
class PreexistingOutputError : public SplitError
{
public:
    PreexistingOutputError(const std::string& msg, std::string path)
        : SplitError(msg), path_(std::move(path))
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

// A line has fewer fields than --key-fields requires
class MissingFieldError : public SplitError
{
public:
    MissingFieldError(std::string source, std::uint64_t line_number)
        : SplitError(
              "Not enough fields in line. File: " + source +
              ", Line: " + std::to_string(line_number))
        , source_(std::move(source))
        , line_number_(line_number)
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

// Open, write, flush or close of an output file failed
class OutputFileError : public SplitError
{
public:
    OutputFileError(const std::string& msg, std::string path)
        : SplitError(msg), path_(std::move(path))
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

}  // namespace tsvu::split
