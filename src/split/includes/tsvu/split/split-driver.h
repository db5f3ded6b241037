#pragma once

#include "tsvu/split/split-config.h"
#include <cstddef>
#include <cstdint>

namespace tsvu::split {

/** Totals for one run */
struct SplitStats
{
    std::size_t inputs = 0;
    std::uint64_t data_lines = 0;
    std::uint64_t files_written = 0;
};

/**
 * Run a split
 *
 * Dispatches to the fixed-block splitter, or to a shard assigner feeding the
 * output file pool. Inputs are read in order and each is closed as soon as
 * it is consumed. All output files are closed before returning, also when an
 * exception escapes.
 *
 * @throws SplitError, common::TsvuError on the first failure
 */
SplitStats
run_split(const SplitConfig& config);

}  // namespace tsvu::split
