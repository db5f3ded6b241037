#pragma once

#include "tsvu/core/logger.h"
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace tsvu::split {

/**
 * Output file name for shard `id` of `num_files`
 *
 * The id is zero-padded to the number of digits in `num_files - 1`, so
 * names sort in shard order: with 100 files, "part_000" .. "part_099".
 */
std::string
shard_filename(
    const std::string& dir,
    const std::string& prefix,
    const std::string& suffix,
    std::uint32_t id,
    std::uint32_t num_files);

/**
 * The N output files of a sharded split, with a cap on how many are open
 * at once.
 *
 * Files are opened lazily in append mode on first write. When the open count
 * reaches the cap, a randomly chosen open file is closed to make room; its
 * handle is reopened on its next write. The header (if any) is written once
 * per file, before its first line, and only if the file had no data.
 */
class OutputFilePool
{
public:
    /**
     * @param num_files Number of shards
     * @param dir Output directory, empty for the current directory
     * @param prefix Filename prefix
     * @param suffix Filename suffix
     * @param write_header Whether files get the header line
     * @param max_open_files Cap on simultaneously open handles, at least 1
     * @param eviction_seed Seed for choosing which handle to close
     */
    OutputFilePool(
        std::uint32_t num_files,
        const std::string& dir,
        const std::string& prefix,
        const std::string& suffix,
        bool write_header,
        std::uint32_t max_open_files,
        std::uint32_t eviction_seed);

    ~OutputFilePool();

    OutputFilePool(const OutputFilePool&) = delete;
    OutputFilePool&
    operator=(const OutputFilePool&) = delete;

    static LogPartition&
    get_log_partition()
    {
        return log_partition_;
    }

    std::uint32_t
    num_files() const
    {
        return static_cast<std::uint32_t>(files_.size());
    }

    const std::string&
    filename(std::uint32_t id) const
    {
        return files_.at(id).filename;
    }

    /**
     * Check the output files before any input is read
     *
     * Without append: returns the first output file that already exists.
     * With append: records which files already hold data, so the header is
     * not added to them.
     */
    std::optional<std::string>
    preflight(bool append);

    /**
     * Set the header line written to each file
     *
     * @throws SplitError if called twice
     */
    void
    set_header(std::string_view header);

    /**
     * Append `line` plus '\n' to shard `id`
     *
     * @throws OutputFileError if the file cannot be opened or written
     */
    void
    write(std::uint32_t id, std::string_view line);

    /**
     * Flush and close every open file
     *
     * @throws OutputFileError if any close fails
     */
    void
    close_all();

    /** Number of handles currently open */
    std::uint32_t
    open_count() const
    {
        return static_cast<std::uint32_t>(open_ids_.size());
    }

    std::uint32_t
    max_open_files() const
    {
        return max_open_files_;
    }

    /** Number of files that received at least one data line */
    std::uint32_t
    files_written() const;

private:
    static LogPartition log_partition_;

    struct OutputFile
    {
        std::string filename;
        std::unique_ptr<std::ofstream> stream;
        bool has_data = false;
        bool received_lines = false;
        // Position in open_ids_ while open
        std::size_t open_slot = 0;
    };

    std::vector<OutputFile> files_;
    std::vector<std::uint32_t> open_ids_;
    bool write_header_;
    std::optional<std::string> header_;
    std::uint32_t max_open_files_;
    std::mt19937 eviction_rng_;

    void
    open_file(std::uint32_t id);

    void
    close_file(std::uint32_t id);

    void
    evict_one();
};

}  // namespace tsvu::split
