#include "tsvu/split/split-config.h"
#include "tsvu/common/common-errors.h"
#include "tsvu/common/field-list.h"
#include "tsvu/common/line-reader.h"
#include "tsvu/core/logger.h"
#include "tsvu/split/open-file-budget.h"
#include "tsvu/split/split-errors.h"

#include <boost/filesystem.hpp>
#include <cstdlib>
#include <random>
#include <utility>

namespace fs = boost::filesystem;
namespace tsvu::split {

namespace {

// Expand a leading "~" or "~/" using $HOME
std::string
expand_tilde(const std::string& path)
{
    if (path.empty() || path[0] != '~')
        return path;
    if (path.size() > 1 && path[1] != '/')
        return path;

    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0')
        return path;

    return std::string(home) + path.substr(1);
}

KeyFields
make_key_fields(const std::string& spec)
{
    std::vector<std::size_t> numbers;
    try
    {
        numbers = common::parse_field_numbers(spec, true);
    }
    catch (const common::FieldListError& e)
    {
        throw ConfigurationError(
            std::string("Invalid '--k|key-fields' option: ") + e.what());
    }

    KeyFields key;
    bool has_zero = false;
    for (auto n : numbers)
    {
        if (n == 0)
            has_zero = true;
    }

    if (has_zero)
    {
        if (numbers.size() != 1)
        {
            throw ConfigurationError(
                "Whole line as key (--k|key-fields 0) cannot be combined "
                "with multiple fields.");
        }
        key.whole_line = true;
        return key;
    }

    key.indices.reserve(numbers.size());
    for (auto n : numbers)
    {
        key.indices.push_back(n - 1);
    }
    return key;
}

}  // namespace

std::string
default_suffix(const std::vector<std::string>& input_files)
{
    if (input_files.empty() || input_files.front() == common::STDIN_NAME)
        return "";
    return fs::path(input_files.front()).extension().string();
}

SplitConfig
make_split_config(
    const CommandLineOptions& options,
    std::optional<std::uint32_t> soft_limit)
{
    SplitConfig config;

    if (!options.lines_per_file && !options.num_files)
    {
        throw ConfigurationError(
            "Either '--l|lines-per-file' or '--n|num-files' is required.");
    }

    if (options.lines_per_file && options.num_files)
    {
        throw ConfigurationError(
            "'--l|lines-per-file' and '--n|num-files' cannot be used "
            "together.");
    }

    if (options.lines_per_file && options.key_fields)
    {
        throw ConfigurationError(
            "'--l|lines-per-file' and '--k|key-fields' cannot be used "
            "together.");
    }

    if (options.num_files && *options.num_files == 1)
    {
        throw ConfigurationError("'--n|num-files must be two or more.");
    }

    if (options.lines_per_file)
    {
        config.mode = FixedBlockMode{*options.lines_per_file};
    }
    else
    {
        ShardedMode sharded;
        sharded.num_files = *options.num_files;
        if (options.key_fields)
        {
            sharded.key_fields = make_key_fields(*options.key_fields);
        }
        config.mode = std::move(sharded);
    }

    if (options.header && options.header_in_only)
    {
        throw ConfigurationError(
            "Use only one of '--H|header' and '--I|header-in-only'.");
    }
    if (options.header)
        config.header_mode = HeaderMode::WRITE_TO_ALL;
    else if (options.header_in_only)
        config.header_mode = HeaderMode::STRIP_ONLY;

    if (options.dir)
    {
        std::string dir = expand_tilde(*options.dir);
        boost::system::error_code ec;
        if (!fs::exists(dir, ec))
        {
            throw ConfigurationError(
                "Directory does not exist: --dir '" + *options.dir + "'");
        }
        if (!fs::is_directory(dir, ec))
        {
            throw ConfigurationError(
                "Path is not a directory: --dir '" + *options.dir + "'");
        }
        config.output_dir = dir;
    }

    config.prefix = options.prefix;
    config.suffix = options.suffix ? *options.suffix
                                   : default_suffix(options.input_files);

    if (config.prefix.find('/') != std::string::npos)
    {
        throw ConfigurationError(
            "'--prefix' cannot contain a path separator: '" + config.prefix +
            "'. Use '--dir' to choose the output directory.");
    }
    if (config.suffix.find('/') != std::string::npos)
    {
        throw ConfigurationError(
            "'--suffix' cannot contain a path separator: '" + config.suffix +
            "'.");
    }

    if (options.delimiter.size() != 1)
    {
        throw ConfigurationError(
            "'--d|delimiter' must be a single byte character: '" +
            options.delimiter + "'");
    }
    if (options.delimiter[0] == '\n')
    {
        throw ConfigurationError("'--d|delimiter' cannot be newline.");
    }
    config.delimiter = options.delimiter[0];

    config.input_files = options.input_files;
    if (config.input_files.empty())
    {
        config.input_files.emplace_back(common::STDIN_NAME);
    }

    config.append = options.append;

    if (options.seed_value != 0)
    {
        config.seed = options.seed_value;
        config.unpredictable_seed = false;
    }
    else if (options.static_seed)
    {
        config.seed = STATIC_SEED;
        config.unpredictable_seed = false;
    }
    else
    {
        std::random_device rd;
        config.seed = static_cast<std::uint32_t>(rd());
        config.unpredictable_seed = true;
    }

    if (!config.is_fixed_block() && config.sharded().key_fields &&
        config.append && config.unpredictable_seed)
    {
        LOGW(
            "Appending with key-based assignment and no fixed seed; keys "
            "will not land in the same files as earlier runs. Use "
            "'--s|static-seed' or '--v|seed-value'.");
    }

    std::uint32_t limit =
        soft_limit ? *soft_limit : current_open_files_soft_limit();
    config.max_open_files =
        resolve_max_open_files(options.max_open_files, limit);

    LOGD(
        "Configuration: mode ",
        config.is_fixed_block() ? "fixed-block" : "sharded",
        ", inputs ",
        config.input_files.size(),
        ", seed ",
        config.seed,
        ", max open files ",
        config.max_open_files);

    return config;
}

}  // namespace tsvu::split
