#pragma once

#include <cstdint>
#include <optional>

namespace tsvu::split {

/** Internal ceiling on simultaneously open output files */
inline constexpr std::uint32_t DEFAULT_MAX_OPEN_FILES = 4096;

/** Descriptors kept back for stdin, stdout, stderr and one input file */
inline constexpr std::uint32_t RESERVED_OPEN_FILES = 4;

/**
 * The process soft limit on open files ('ulimit -n').
 *
 * Unlimited, or larger than 32 bits, is reported as UINT32_MAX.
 *
 * @throws ConfigurationError if getrlimit fails
 */
std::uint32_t
current_open_files_soft_limit();

/**
 * Number of output files that may be open at the same time
 *
 * `min(requested or DEFAULT_MAX_OPEN_FILES, soft_limit) - RESERVED_OPEN_FILES`
 *
 * @param requested --max-open-files value, if given
 * @param soft_limit Process soft limit on open files
 * @throws ConfigurationError if the soft limit or the request leaves no room
 * after the reserved descriptors, or the request exceeds the soft limit
 */
std::uint32_t
resolve_max_open_files(
    std::optional<std::uint32_t> requested,
    std::uint32_t soft_limit);

}  // namespace tsvu::split
