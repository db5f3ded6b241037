#include "tsvu/split/shard-assigner.h"
#include "tsvu/common/field-list.h"
#include "tsvu/split/split-errors.h"

#include <nudb/xxhasher.hpp>
#include <utility>

namespace tsvu::split {

std::uint32_t
key_hash(std::string_view key, std::uint32_t seed)
{
    ::nudb::xxhasher h(seed);
    return static_cast<std::uint32_t>(h(key.data(), key.size()));
}

UniformRandomAssigner::UniformRandomAssigner(
    std::uint32_t num_shards,
    std::uint32_t seed)
    : num_shards_(num_shards), rng_(seed), dist_(0, num_shards - 1)
{
}

std::uint32_t
UniformRandomAssigner::assign(std::string_view, const InputPosition&)
{
    return dist_(rng_);
}

KeyHashAssigner::KeyHashAssigner(
    std::uint32_t num_shards,
    KeyFields key,
    char delimiter,
    std::uint32_t seed)
    : num_shards_(num_shards)
    , key_(std::move(key))
    , delimiter_(delimiter)
    , seed_(seed)
{
}

std::string_view
KeyHashAssigner::key_for(std::string_view line, const InputPosition& where)
{
    if (key_.whole_line)
        return line;

    if (!common::extract_fields(line, key_.indices, delimiter_, fields_))
    {
        throw MissingFieldError(where.source, where.line_number);
    }

    if (fields_.size() == 1)
        return fields_.front();

    key_buffer_.clear();
    for (std::size_t i = 0; i < fields_.size(); ++i)
    {
        if (i != 0)
            key_buffer_.push_back(delimiter_);
        key_buffer_.append(fields_[i].data(), fields_[i].size());
    }
    return key_buffer_;
}

std::uint32_t
KeyHashAssigner::assign(std::string_view line, const InputPosition& where)
{
    return key_hash(key_for(line, where), seed_) % num_shards_;
}

std::unique_ptr<ShardAssigner>
make_shard_assigner(const SplitConfig& config)
{
    if (config.is_fixed_block())
    {
        throw SplitError("Shard assignment requires '--n|num-files'.");
    }

    const auto& sharded = config.sharded();
    if (sharded.key_fields)
    {
        return std::make_unique<KeyHashAssigner>(
            sharded.num_files,
            *sharded.key_fields,
            config.delimiter,
            config.seed);
    }
    return std::make_unique<UniformRandomAssigner>(
        sharded.num_files, config.seed);
}

}  // namespace tsvu::split
