#pragma once

#include "tsvu/split/arg-options.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tsvu::split {

/** Seed used by --static-seed */
inline constexpr std::uint32_t STATIC_SEED = 2438424139u;

enum class HeaderMode {
    NONE,          // Input has no header
    WRITE_TO_ALL,  // --header: every output file starts with the header
    STRIP_ONLY     // --header-in-only: header is dropped
};

/** Key used for key-based shard assignment */
struct KeyFields
{
    /** Use the entire line as the key ("-k 0") */
    bool whole_line = false;

    /** 0-based field indices, in key order; empty when whole_line */
    std::vector<std::size_t> indices;
};

/** --lines-per-file K */
struct FixedBlockMode
{
    std::uint64_t lines_per_file = 0;
};

/** --num-files N, optionally with --key-fields */
struct ShardedMode
{
    std::uint32_t num_files = 0;
    std::optional<KeyFields> key_fields;
};

/**
 * Validated, immutable run configuration.
 *
 * Built once from the command line by make_split_config and only read
 * afterwards.
 */
struct SplitConfig
{
    std::variant<FixedBlockMode, ShardedMode> mode;

    /** Inputs in processing order; "-" is standard input */
    std::vector<std::string> input_files;

    char delimiter = '\t';
    HeaderMode header_mode = HeaderMode::NONE;

    /** Output directory; empty means the current directory */
    std::string output_dir;
    std::string prefix;
    std::string suffix;

    bool append = false;

    /** Resolved PRNG/hash seed */
    std::uint32_t seed = 0;

    /** True if the seed came from std::random_device */
    bool unpredictable_seed = true;

    /** Resolved open output file budget */
    std::uint32_t max_open_files = 0;

    bool
    is_fixed_block() const
    {
        return std::holds_alternative<FixedBlockMode>(mode);
    }

    const FixedBlockMode&
    fixed_block() const
    {
        return std::get<FixedBlockMode>(mode);
    }

    const ShardedMode&
    sharded() const
    {
        return std::get<ShardedMode>(mode);
    }

    bool
    has_header() const
    {
        return header_mode != HeaderMode::NONE;
    }

    bool
    writes_header() const
    {
        return header_mode == HeaderMode::WRITE_TO_ALL;
    }
};

/**
 * Validate command line options and derive the run configuration
 *
 * Checks every cross-option constraint, resolves the seed, the default
 * suffix and the open file budget. No files are created or opened.
 *
 * @param options Parsed command line options
 * @param soft_limit Per-process open file limit; read from the OS when not
 * given
 * @return The immutable configuration
 * @throws ConfigurationError on any invalid or contradictory option
 */
SplitConfig
make_split_config(
    const CommandLineOptions& options,
    std::optional<std::uint32_t> soft_limit = std::nullopt);

/**
 * Default output suffix: the extension of the first input file, or empty
 * when reading standard input.
 */
std::string
default_suffix(const std::vector<std::string>& input_files);

}  // namespace tsvu::split
