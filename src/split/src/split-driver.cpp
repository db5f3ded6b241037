#include "tsvu/split/split-driver.h"
#include "tsvu/common/line-reader.h"
#include "tsvu/core/logger.h"
#include "tsvu/split/fixed-block-splitter.h"
#include "tsvu/split/output-file-pool.h"
#include "tsvu/split/shard-assigner.h"
#include "tsvu/split/split-errors.h"

#include <string_view>

namespace tsvu::split {

namespace {

SplitStats
split_fixed_block(const SplitConfig& config)
{
    FixedBlockOptions options;
    options.lines_per_file = config.fixed_block().lines_per_file;
    options.dir = config.output_dir;
    options.prefix = config.prefix;
    options.suffix = config.suffix;
    options.header_mode = config.header_mode;
    options.append = config.append;

    FixedBlockSplitter splitter(options);
    SplitStats stats;
    for (const auto& name : config.input_files)
    {
        splitter.split_file(name);
        ++stats.inputs;
    }
    splitter.finish();

    stats.data_lines = splitter.lines_written();
    stats.files_written = splitter.files_written();
    return stats;
}

SplitStats
split_sharded(const SplitConfig& config)
{
    const auto& sharded = config.sharded();
    OutputFilePool pool(
        sharded.num_files,
        config.output_dir,
        config.prefix,
        config.suffix,
        config.writes_header(),
        config.max_open_files,
        config.seed);

    if (auto existing = pool.preflight(config.append))
    {
        throw PreexistingOutputError(
            "One or more output files already exist. Use '--a|append' to "
            "append to existing files. File: '" +
                *existing + "'.",
            *existing);
    }

    auto assigner = make_shard_assigner(config);

    enum class LineState { EXPECTING_HEADER, STREAMING };

    SplitStats stats;
    bool header_set = false;
    for (const auto& name : config.input_files)
    {
        common::InputSource input(name);
        const std::string source = input.display_name();
        common::LineReader reader(input);

        LineState line_state = config.has_header() ? LineState::EXPECTING_HEADER
                                                   : LineState::STREAMING;
        std::string_view line;
        while (reader.next_line(line))
        {
            const std::uint64_t line_number = reader.line_number();
            if (line_number == 1)
            {
                common::throw_if_windows_newline(line, source, line_number);
            }

            if (line_state == LineState::EXPECTING_HEADER)
            {
                // The first header seen is the one written out
                if (!header_set)
                {
                    pool.set_header(line);
                    header_set = true;
                }
                line_state = LineState::STREAMING;
                continue;
            }

            InputPosition where{source, line_number};
            pool.write(assigner->assign(line, where), line);
            ++stats.data_lines;
        }

        input.close();
        ++stats.inputs;
    }

    pool.close_all();
    stats.files_written = pool.files_written();
    return stats;
}

}  // namespace

SplitStats
run_split(const SplitConfig& config)
{
    LOGI(
        "Splitting ",
        config.input_files.size(),
        " input(s) into '",
        config.output_dir.empty() ? std::string(".") : config.output_dir,
        "'");

    SplitStats stats = config.is_fixed_block() ? split_fixed_block(config)
                                               : split_sharded(config);

    LOGI(
        "Done: ",
        stats.inputs,
        " input(s), ",
        stats.data_lines,
        " data line(s), ",
        stats.files_written,
        " output file(s) written");
    return stats;
}

}  // namespace tsvu::split
