#include "tsvu/split/output-file-pool.h"
#include "tsvu/split/split-errors.h"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <cerrno>
#include <cstring>
#include <utility>

namespace fs = boost::filesystem;
namespace tsvu::split {

LogPartition OutputFilePool::log_partition_("output-pool", LogLevel::INHERIT);

namespace {

std::size_t
digit_count(std::uint32_t value)
{
    std::size_t digits = 1;
    while (value >= 10)
    {
        value /= 10;
        ++digits;
    }
    return digits;
}

bool
file_has_data(const std::string& filename)
{
    boost::system::error_code ec;
    auto size = fs::file_size(filename, ec);
    return !ec && size > 0;
}

}  // namespace

std::string
shard_filename(
    const std::string& dir,
    const std::string& prefix,
    const std::string& suffix,
    std::uint32_t id,
    std::uint32_t num_files)
{
    const std::size_t width = digit_count(num_files > 0 ? num_files - 1 : 0);
    std::string number = std::to_string(id);
    if (number.size() < width)
        number.insert(0, width - number.size(), '0');

    std::string name = prefix + number + suffix;
    if (dir.empty())
        return name;
    return (fs::path(dir) / name).string();
}

OutputFilePool::OutputFilePool(
    std::uint32_t num_files,
    const std::string& dir,
    const std::string& prefix,
    const std::string& suffix,
    bool write_header,
    std::uint32_t max_open_files,
    std::uint32_t eviction_seed)
    : write_header_(write_header)
    , max_open_files_(max_open_files == 0 ? 1 : max_open_files)
    , eviction_rng_(eviction_seed)
{
    files_.resize(num_files);
    for (std::uint32_t id = 0; id < num_files; ++id)
    {
        files_[id].filename = shard_filename(dir, prefix, suffix, id, num_files);
    }
    open_ids_.reserve(std::min(num_files, max_open_files_));

    OLOGD(
        "Pool created: ",
        num_files,
        " files, at most ",
        max_open_files_,
        " open");
}

OutputFilePool::~OutputFilePool()
{
    while (!open_ids_.empty())
    {
        std::uint32_t id = open_ids_.back();
        auto& file = files_[id];
        file.stream->close();
        if (file.stream->fail())
        {
            LOGE("Error closing output file: '", file.filename, "'");
        }
        file.stream.reset();
        open_ids_.pop_back();
    }
}

std::optional<std::string>
OutputFilePool::preflight(bool append)
{
    for (auto& file : files_)
    {
        if (append)
        {
            file.has_data = file_has_data(file.filename);
        }
        else
        {
            boost::system::error_code ec;
            if (fs::exists(file.filename, ec))
                return file.filename;
        }
    }
    return std::nullopt;
}

void
OutputFilePool::set_header(std::string_view header)
{
    if (header_)
    {
        throw SplitError("Output header already set");
    }
    header_ = std::string(header);
}

void
OutputFilePool::open_file(std::uint32_t id)
{
    if (open_ids_.size() >= max_open_files_)
    {
        evict_one();
    }

    auto& file = files_[id];
    // Files left alone by preflight may have been written by another run
    if (!file.has_data && file_has_data(file.filename))
    {
        file.has_data = true;
    }

    file.stream = std::make_unique<std::ofstream>(
        file.filename, std::ios::binary | std::ios::app);
    if (!file.stream->is_open())
    {
        std::string reason = std::strerror(errno);
        file.stream.reset();
        throw OutputFileError(
            "Cannot open output file: '" + file.filename + "': " + reason,
            file.filename);
    }

    file.open_slot = open_ids_.size();
    open_ids_.push_back(id);
    OLOGD("Opened ", file.filename, " (", open_ids_.size(), " open)");
}

void
OutputFilePool::close_file(std::uint32_t id)
{
    auto& file = files_[id];

    // Swap-remove from the open list
    std::size_t slot = file.open_slot;
    std::uint32_t last = open_ids_.back();
    open_ids_[slot] = last;
    files_[last].open_slot = slot;
    open_ids_.pop_back();

    file.stream->close();
    bool failed = file.stream->fail();
    file.stream.reset();
    if (failed)
    {
        throw OutputFileError(
            "Error closing output file: '" + file.filename + "'",
            file.filename);
    }
}

void
OutputFilePool::evict_one()
{
    std::uniform_int_distribution<std::size_t> dist(0, open_ids_.size() - 1);
    std::uint32_t victim = open_ids_[dist(eviction_rng_)];
    OLOGD("Evicting ", files_[victim].filename);
    close_file(victim);
}

void
OutputFilePool::write(std::uint32_t id, std::string_view line)
{
    if (id >= files_.size())
    {
        throw SplitError(
            "Output file id out of range: " + std::to_string(id) + " of " +
            std::to_string(files_.size()));
    }

    auto& file = files_[id];
    if (!file.stream)
    {
        open_file(id);
    }

    auto& out = *file.stream;
    if (!file.has_data && write_header_ && header_)
    {
        out.write(header_->data(), static_cast<std::streamsize>(header_->size()));
        out.put('\n');
    }
    out.write(line.data(), static_cast<std::streamsize>(line.size()));
    out.put('\n');

    if (!out)
    {
        throw OutputFileError(
            "Error writing output file: '" + file.filename + "'",
            file.filename);
    }

    file.has_data = true;
    file.received_lines = true;
}

void
OutputFilePool::close_all()
{
    std::optional<OutputFileError> first_error;
    while (!open_ids_.empty())
    {
        try
        {
            close_file(open_ids_.back());
        }
        catch (const OutputFileError& e)
        {
            // The first failure is rethrown; later ones are only logged
            if (!first_error)
                first_error = e;
            else
                LOGE(e.what());
        }
    }

    if (first_error)
        throw *first_error;
}

std::uint32_t
OutputFilePool::files_written() const
{
    std::uint32_t count = 0;
    for (const auto& file : files_)
    {
        if (file.received_lines)
            ++count;
    }
    return count;
}

}  // namespace tsvu::split
