#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tsvu::split {

inline constexpr const char* TSV_SPLIT_VERSION = "2.2.0";

/**
 * Type-safe structure for command line options
 *
 * Holds the options as given. Cross-option validation and derived values
 * (seed, open file budget, default suffix) are the job of make_split_config.
 */
struct CommandLineOptions
{
    /** Program name used to prefix diagnostics */
    std::string program_name = "tsv-split";

    /** Input files in command line order; "-" is standard input */
    std::vector<std::string> input_files;

    /** Input has a header line; write it to every output file */
    bool header = false;

    /** Input has a header line; drop it from the output */
    bool header_in_only = false;

    /** Number of lines per output file (fixed-block mode) */
    std::optional<std::uint64_t> lines_per_file;

    /** Number of output files (random or key-based assignment) */
    std::optional<std::uint32_t> num_files;

    /** Field list used as the shard key, "0" for the whole line */
    std::optional<std::string> key_fields;

    /** Directory to write output files to */
    std::optional<std::string> dir;

    /** Output filename prefix */
    std::string prefix = "part_";

    /** Output filename suffix; defaults to the first input's extension */
    std::optional<std::string> suffix;

    /** Append to existing output files */
    bool append = false;

    /** Use the same random seed every run */
    bool static_seed = false;

    /** Explicit random seed; 0 means not given */
    std::uint32_t seed_value = 0;

    /** Field delimiter as typed; must be a single byte */
    std::string delimiter = "\t";

    /** Override for the maximum number of open files */
    std::optional<std::uint32_t> max_open_files;

    /** Log verbosity level */
    std::string log_level = "warn";

    bool show_help = false;
    bool show_help_verbose = false;
    bool show_version = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Parse command line arguments into a structured options object
 *
 * @param argc Argument count from main
 * @param argv Argument values from main
 * @return A populated CommandLineOptions structure; `valid` is false and
 * `error_message` set if the arguments could not be parsed
 */
CommandLineOptions
parse_argv(int argc, char* argv[]);

}  // namespace tsvu::split
