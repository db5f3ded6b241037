#include "tsvu/common/common-errors.h"
#include "tsvu/core/logger.h"
#include "tsvu/split/arg-options.h"
#include "tsvu/split/split-config.h"
#include "tsvu/split/split-driver.h"

#include <exception>
#include <iostream>

using namespace tsvu::split;

int
main(int argc, char* argv[])
{
    std::ios::sync_with_stdio(false);

    // Parse command line arguments
    CommandLineOptions options = parse_argv(argc, argv);
    const std::string& program = options.program_name;

    if (!options.valid)
    {
        std::cerr << "[" << program << "] Error processing command line "
                  << "arguments: "
                  << options.error_message.value_or("unknown error")
                  << std::endl;
        return 1;
    }

    if (options.show_help || options.show_help_verbose)
    {
        std::cout << options.help_text << std::flush;
        return 0;
    }

    if (options.show_version)
    {
        std::cout << program << " (tsv-utils) " << TSV_SPLIT_VERSION
                  << std::endl;
        return 0;
    }

    try
    {
        if (!Logger::set_level(options.log_level))
        {
            Logger::set_level(LogLevel::WARNING);
            std::cerr << "[" << program
                      << "] Unrecognized log level: " << options.log_level
                      << ", falling back to 'warn'" << std::endl;
        }

        SplitConfig config = make_split_config(options);
        run_split(config);
        return 0;
    }
    catch (const tsvu::common::TsvuError& e)
    {
        std::cerr << "[" << program << "] Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[" << program << "] Error: " << e.what() << std::endl;
        return 1;
    }
}
