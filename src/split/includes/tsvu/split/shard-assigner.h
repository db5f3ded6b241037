#pragma once

#include "tsvu/split/split-config.h"
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace tsvu::split {

/** Where a line came from, for error messages */
struct InputPosition
{
    const std::string& source;
    std::uint64_t line_number;
};

/**
 * Chooses the output shard for each data line in sharded mode.
 */
class ShardAssigner
{
public:
    virtual ~ShardAssigner() = default;

    /**
     * Pick the shard for a data line
     *
     * @param line Line without its terminator
     * @param where Input name and line number, for diagnostics
     * @return Shard id in [0, num_shards())
     * @throws MissingFieldError if a key field is missing
     */
    virtual std::uint32_t
    assign(std::string_view line, const InputPosition& where) = 0;

    virtual std::uint32_t
    num_shards() const = 0;
};

/**
 * Uniform random assignment, independent of line content.
 *
 * Reproducible for a given seed.
 */
class UniformRandomAssigner : public ShardAssigner
{
public:
    UniformRandomAssigner(std::uint32_t num_shards, std::uint32_t seed);

    std::uint32_t
    assign(std::string_view line, const InputPosition& where) override;

    std::uint32_t
    num_shards() const override
    {
        return num_shards_;
    }

private:
    std::uint32_t num_shards_;
    std::mt19937 rng_;
    std::uniform_int_distribution<std::uint32_t> dist_;
};

/**
 * Seeded 32-bit hash of a key: the low 32 bits of xxHash64
 */
std::uint32_t
key_hash(std::string_view key, std::uint32_t seed);

/**
 * Key-based assignment: key_hash of the key, modulo the shard count.
 *
 * The key is the whole line, or the selected fields joined by the
 * delimiter. Lines with equal keys always go to the same shard for a given
 * seed and shard count.
 */
class KeyHashAssigner : public ShardAssigner
{
public:
    KeyHashAssigner(
        std::uint32_t num_shards,
        KeyFields key,
        char delimiter,
        std::uint32_t seed);

    std::uint32_t
    assign(std::string_view line, const InputPosition& where) override;

    std::uint32_t
    num_shards() const override
    {
        return num_shards_;
    }

    /** The key bytes hashed for `line`; exposed for tests */
    std::string_view
    key_for(std::string_view line, const InputPosition& where);

private:
    std::uint32_t num_shards_;
    KeyFields key_;
    char delimiter_;
    std::uint32_t seed_;
    std::vector<std::string_view> fields_;
    std::string key_buffer_;
};

/**
 * Build the assigner for a sharded configuration
 *
 * @throws SplitError if the configuration is not in sharded mode
 */
std::unique_ptr<ShardAssigner>
make_shard_assigner(const SplitConfig& config);

}  // namespace tsvu::split
