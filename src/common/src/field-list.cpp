#include "tsvu/common/field-list.h"
#include "tsvu/common/common-errors.h"

#include <algorithm>
#include <charconv>
#include <limits>
#include <string>

namespace tsvu::common {

namespace {

// A field number is at most this large; guards the range expansion below
constexpr std::size_t MAX_FIELD_NUMBER = 1u << 20;

std::size_t
parse_field_number(
    std::string_view text,
    std::string_view spec,
    bool allow_zero)
{
    if (text.empty())
    {
        throw FieldListError(
            "Invalid field list: '" + std::string(spec) + "'.");
    }

    std::size_t value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size())
    {
        throw FieldListError(
            "Field numbers must be non-negative integers: '" +
            std::string(text) + "'.");
    }

    if (value == 0 && !allow_zero)
    {
        throw FieldListError(
            "Field numbers must be greater than zero: '" + std::string(text) +
            "'.");
    }

    if (value > MAX_FIELD_NUMBER)
    {
        throw FieldListError(
            "Field number too large: '" + std::string(text) + "'.");
    }

    return value;
}

}  // namespace

std::vector<std::size_t>
parse_field_numbers(std::string_view spec, bool allow_zero)
{
    if (spec.empty())
    {
        throw FieldListError("Empty field list.");
    }

    std::vector<std::size_t> fields;
    std::size_t group_start = 0;

    while (group_start <= spec.size())
    {
        std::size_t comma = spec.find(',', group_start);
        if (comma == std::string_view::npos)
            comma = spec.size();

        std::string_view group = spec.substr(group_start, comma - group_start);
        if (group.empty())
        {
            throw FieldListError(
                "Invalid field list: '" + std::string(spec) + "'.");
        }

        std::size_t hyphen = group.find('-');
        if (hyphen == std::string_view::npos)
        {
            fields.push_back(parse_field_number(group, spec, allow_zero));
        }
        else
        {
            if (hyphen == 0 || hyphen + 1 == group.size())
            {
                throw FieldListError(
                    "Incomplete ranges are not supported: '" +
                    std::string(group) + "'.");
            }

            std::size_t first =
                parse_field_number(group.substr(0, hyphen), spec, allow_zero);
            std::size_t last =
                parse_field_number(group.substr(hyphen + 1), spec, allow_zero);

            if (first <= last)
            {
                for (std::size_t f = first; f <= last; ++f)
                    fields.push_back(f);
            }
            else
            {
                for (std::size_t f = first; f >= last && f > 0; --f)
                    fields.push_back(f);
                if (last == 0)
                    fields.push_back(0);
            }
        }

        group_start = comma + 1;
    }

    return fields;
}

bool
extract_fields(
    std::string_view line,
    const std::vector<std::size_t>& indices,
    char delimiter,
    std::vector<std::string_view>& out)
{
    out.assign(indices.size(), std::string_view());
    if (indices.empty())
        return true;

    const std::size_t max_index =
        *std::max_element(indices.begin(), indices.end());

    std::size_t field_index = 0;
    std::size_t field_start = 0;

    while (field_index <= max_index)
    {
        std::size_t field_end = line.find(delimiter, field_start);
        bool last_field = (field_end == std::string_view::npos);
        if (last_field)
            field_end = line.size();

        std::string_view field =
            line.substr(field_start, field_end - field_start);

        for (std::size_t i = 0; i < indices.size(); ++i)
        {
            if (indices[i] == field_index)
                out[i] = field;
        }

        if (last_field)
            break;

        ++field_index;
        field_start = field_end + 1;
    }

    return field_index >= max_index;
}

}  // namespace tsvu::common
