#include "tsvu/split/open-file-budget.h"
#include "tsvu/core/logger.h"
#include "tsvu/split/split-errors.h"

#include <sys/resource.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <string>

namespace tsvu::split {

namespace {

const char* const ULIMIT_HINT =
    "\nRun 'ulimit -n' to see the soft limit."
    "\nRun 'ulimit -Hn' to see the hard limit."
    "\nRun 'ulimit -Sn NUM' to change the soft limit.";

}  // namespace

std::uint32_t
current_open_files_soft_limit()
{
    struct rlimit limits;
    if (getrlimit(RLIMIT_NOFILE, &limits) != 0)
    {
        throw ConfigurationError(
            std::string("Cannot read the open file limit (getrlimit): ") +
            std::strerror(errno));
    }

    if (limits.rlim_cur == RLIM_INFINITY ||
        limits.rlim_cur > std::numeric_limits<std::uint32_t>::max())
    {
        return std::numeric_limits<std::uint32_t>::max();
    }

    return static_cast<std::uint32_t>(limits.rlim_cur);
}

std::uint32_t
resolve_max_open_files(
    std::optional<std::uint32_t> requested,
    std::uint32_t soft_limit)
{
    if (requested && *requested <= RESERVED_OPEN_FILES)
    {
        throw ConfigurationError(
            "'--max-open-files' must be at least " +
            std::to_string(RESERVED_OPEN_FILES + 1) + ".");
    }

    if (requested && *requested > soft_limit)
    {
        throw ConfigurationError(
            "'--max-open-files' value (" + std::to_string(*requested) +
            ") greater than current system limit (" +
            std::to_string(soft_limit) + ")." + ULIMIT_HINT);
    }

    if (soft_limit <= RESERVED_OPEN_FILES)
    {
        throw ConfigurationError(
            "System open file limit too small. Current value: " +
            std::to_string(soft_limit) + ". Must be " +
            std::to_string(RESERVED_OPEN_FILES + 1) + " or more." +
            ULIMIT_HINT);
    }

    const std::uint32_t limit =
        std::min(requested.value_or(DEFAULT_MAX_OPEN_FILES), soft_limit);

    LOGD(
        "Open file budget: limit ",
        limit,
        ", soft limit ",
        soft_limit,
        ", reserved ",
        RESERVED_OPEN_FILES);

    return limit - RESERVED_OPEN_FILES;
}

}  // namespace tsvu::split
