#ifndef SPLIT_UNIT_HPP
#define SPLIT_UNIT_HPP

//local
#include <config.hpp>

//internal
#include <optional>
#include <string_view>
#include <stdint.h>

//external
#include <magic_enum.hpp>

// Unit in which the part size is provided by the user
enum class split_unit
{
    Bytes,
    KiloBytes,
    MegaBytes,
    GigaBytes,
    Lines
};

// Number of bytes in one unit
// Lines are counted one by one so their factor is 1 too
inline uint64_t get_split_unit_factor(split_unit unit)
{
    switch (unit)
    {
        case split_unit::KiloBytes:
        {
            return config::KILOBYTE;
        }
        case split_unit::MegaBytes:
        {
            return config::MEGABYTE;
        }
        case split_unit::GigaBytes:
        {
            return config::GIGABYTE;
        }
        default:
        {
            return 1;
        }
    }
}

// Case-insensitive lookup of the unit by its name, e.g. "megabytes" -> split_unit::MegaBytes
inline std::optional<split_unit> parse_split_unit(std::string_view unit_name)
{
    return magic_enum::enum_cast<split_unit>(unit_name, magic_enum::case_insensitive);
}

#endif
