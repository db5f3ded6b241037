#include "tsvu/split/arg-options.h"

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <sstream>
#include <string>

namespace po = boost::program_options;
namespace tsvu::split {

namespace {

const char* const HELP_VERBOSE_TEXT =
    "Header lines: There are two ways to handle input with headers: write a\n"
    "header to all output files (-H|--header), or exclude headers from all\n"
    "output files (-I|--header-in-only). With multiple input files the\n"
    "header of the first file is used and the others are dropped.\n"
    "\n"
    "Random assignment (-n|--num-files): each input line is written to a\n"
    "randomly selected output file. Output files have similar but not\n"
    "identical numbers of records.\n"
    "\n"
    "Random assignment by key (-n|--num-files NUM, -k|--key-fields FIELDS):\n"
    "all lines with the same key are written to the same file. Use\n"
    "'-k 0' to use the entire line as the key.\n"
    "\n"
    "Random seed: by default every run produces different assignments.\n"
    "-s|--static-seed makes runs repeatable; -v|--seed-value sets the seed.\n"
    "\n"
    "Appending to existing files: by default an error is raised if an output\n"
    "file already exists. -a|--append adds lines to existing files instead;\n"
    "header lines are not added to files that already have data. Key-based\n"
    "splitting should use the same --num-files, --key-fields and seed on\n"
    "every run.\n"
    "\n"
    "Max number of open files: random and key-based assignment run fastest\n"
    "when every output file stays open. By default up to 4096 files are kept\n"
    "open, or the per-process limit ('ulimit -n'), whichever is smaller.\n"
    "--max-open-files changes this, but cannot exceed the system limit.\n";

// Non-negative integer option value
template <typename T>
struct Count
{
    T value = 0;
};

// lexical_cast accepts "-3" for unsigned types and wraps it, so a sign is
// rejected before conversion
template <typename T>
void
validate(
    boost::any& v,
    const std::vector<std::string>& values,
    Count<T>*,
    int)
{
    po::validators::check_first_occurrence(v);
    const std::string& text = po::validators::get_single_string(values);
    if (text.empty() || text[0] == '-' || text[0] == '+')
    {
        throw po::invalid_option_value(text);
    }
    try
    {
        v = boost::any(Count<T>{boost::lexical_cast<T>(text)});
    }
    catch (const boost::bad_lexical_cast&)
    {
        throw po::invalid_option_value(text);
    }
}

}  // namespace

CommandLineOptions
parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;
    if (argc > 0)
    {
        options.program_name =
            boost::filesystem::path(argv[0]).stem().string();
    }

    po::options_description desc("Options");
    desc.add_options()("help,h", "Print help")(
        "help-verbose", "Print more detailed help")(
        "version,V", "Print version information and exit")(
        "header,H",
        po::bool_switch(),
        "Input files have a header line. Write the header to each output "
        "file.")(
        "header-in-only,I",
        po::bool_switch(),
        "Input files have a header line. Do not write the header to output "
        "files.")(
        "lines-per-file,l",
        po::value<Count<std::uint64_t>>(),
        "NUM  Number of lines to write to each output file (excluding the "
        "header line).")(
        "num-files,n",
        po::value<Count<std::uint32_t>>(),
        "NUM  Number of output files to generate.")(
        "key-fields,k",
        po::value<std::string>(),
        "<field-list>  Fields to use as key. Lines with the same key are "
        "written to the same output file. Use '-k 0' to use the entire "
        "line as the key.")(
        "dir",
        po::value<std::string>(),
        "STR  Directory to write to. Default: current working directory.")(
        "prefix",
        po::value<std::string>()->default_value("part_"),
        "STR  Filename prefix.")(
        "suffix",
        po::value<std::string>(),
        "STR  Filename suffix. Default: extension of the first input file.")(
        "append,a", po::bool_switch(), "Append to existing files.")(
        "static-seed,s",
        po::bool_switch(),
        "Use the same random seed every run.")(
        "seed-value,v",
        po::value<Count<std::uint32_t>>(),
        "NUM  Sets the random seed. Use a non-zero, 32 bit positive "
        "integer. Zero is a no-op.")(
        "delimiter,d",
        po::value<std::string>(),
        "CHR  Field delimiter. Default: TAB.")(
        "max-open-files",
        po::value<Count<std::uint32_t>>(),
        "NUM  Maximum open file handles to use. Min of 5 required.")(
        "log-level",
        po::value<std::string>()->default_value("warn"),
        "Log level (error, warn, info, debug)");

    po::options_description hidden("Hidden options");
    hidden.add_options()(
        "input-file", po::value<std::vector<std::string>>(), "Input files");

    po::options_description all_options;
    all_options.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("input-file", -1);

    std::ostringstream help_stream;
    help_stream << "Synopsis: " << options.program_name
                << " [options] [file...]" << std::endl
                << std::endl
                << "Split input lines into multiple output files. There are "
                   "three modes of"
                << std::endl
                << "operation:" << std::endl
                << std::endl
                << "* Fixed number of lines per file (-l|--lines-per-file "
                   "NUM)"
                << std::endl
                << "* Random assignment of lines to files (-n|--num-files "
                   "NUM)"
                << std::endl
                << "* Random assignment by key (-n|--num-files NUM, "
                   "-k|--key-fields FIELDS)"
                << std::endl
                << std::endl
                << "Output files are written to the current directory by "
                   "default and are"
                << std::endl
                << "named 'part_NNN' plus the input file's extension."
                << std::endl
                << std::endl
                << desc << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(all_options)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (vm.count("help-verbose"))
        {
            options.show_help_verbose = true;
            options.help_text += "\n";
            options.help_text += HELP_VERBOSE_TEXT;
            return options;
        }

        if (vm.count("version"))
        {
            options.show_version = true;
            return options;
        }

        if (vm.count("input-file"))
        {
            options.input_files =
                vm["input-file"].as<std::vector<std::string>>();
        }
        if (options.input_files.empty())
        {
            options.input_files.push_back("-");
        }

        options.header = vm["header"].as<bool>();
        options.header_in_only = vm["header-in-only"].as<bool>();
        options.append = vm["append"].as<bool>();
        options.static_seed = vm["static-seed"].as<bool>();

        // Zero counts are treated as "not given", as with the seed value
        if (vm.count("lines-per-file"))
        {
            auto n = vm["lines-per-file"].as<Count<std::uint64_t>>().value;
            if (n != 0)
                options.lines_per_file = n;
        }

        if (vm.count("num-files"))
        {
            auto n = vm["num-files"].as<Count<std::uint32_t>>().value;
            if (n != 0)
                options.num_files = n;
        }

        if (vm.count("key-fields"))
        {
            options.key_fields = vm["key-fields"].as<std::string>();
        }

        if (vm.count("dir"))
        {
            options.dir = vm["dir"].as<std::string>();
        }

        options.prefix = vm["prefix"].as<std::string>();

        if (vm.count("suffix"))
        {
            options.suffix = vm["suffix"].as<std::string>();
        }

        if (vm.count("seed-value"))
        {
            options.seed_value =
                vm["seed-value"].as<Count<std::uint32_t>>().value;
        }

        if (vm.count("delimiter"))
        {
            options.delimiter = vm["delimiter"].as<std::string>();
        }

        if (vm.count("max-open-files"))
        {
            options.max_open_files =
                vm["max-open-files"].as<Count<std::uint32_t>>().value;
        }

        std::string level = vm["log-level"].as<std::string>();
        if (level != "error" && level != "warn" && level != "info" &&
            level != "debug")
        {
            options.valid = false;
            options.error_message =
                "Log level must be one of: error, warn, info, debug";
            return options;
        }
        options.log_level = level;
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }

    return options;
}

}  // namespace tsvu::split
