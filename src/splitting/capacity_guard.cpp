#include <splitting/capacity_guard.hpp>

//internal
#include <fstream>
#include <sstream>

drive_info capacity_guard::query_drive_info(
    const std::filesystem::path& path,
    std::error_code& error_code)
{
    std::filesystem::path existing_path = std::filesystem::absolute(path, error_code);

    if (error_code)
    {
        return drive_info{};
    }

    // Climb up to the folder that actually exists since the destination can be created later
    while (!std::filesystem::exists(existing_path, error_code) && existing_path.has_relative_path())
    {
        existing_path = existing_path.parent_path();
    }

    if (error_code)
    {
        return drive_info{};
    }

    std::filesystem::space_info space = std::filesystem::space(existing_path, error_code);

    if (error_code)
    {
        return drive_info{};
    }

    existing_path = std::filesystem::weakly_canonical(existing_path, error_code);

    if (error_code)
    {
        return drive_info{};
    }

    return drive_info{space.available, determine_filesystem_format(existing_path)};
}

bool capacity_guard::check(
    uint64_t source_file_size,
    uint64_t part_size,
    operation_mode mode,
    const drive_info& drive,
    progress_reporter& reporter,
    file_splitter::error_code& error_code,
    const limits_table& limits)
{
    if (mode == operation_mode::by_bytes && part_size < config::minimum_part_size)
    {
        reporter.message(message_code::error_minimum_part_size, config::minimum_part_size);
        error_code = file_splitter::error::part_size_too_small;

        return false;
    }

    if (mode == operation_mode::by_lines && part_size == 0)
    {
        reporter.message(message_code::error_minimum_part_size, 1);
        error_code = file_splitter::error::part_size_too_small;

        return false;
    }

    // Require the room for the whole source file even though parts replace it rather than add to it
    if (drive.available_space <= source_file_size)
    {
        reporter.message(message_code::error_no_space_to_split, drive.available_space, source_file_size);
        error_code = file_splitter::error::insufficient_space;

        return false;
    }

    if (mode == operation_mode::by_bytes)
    {
        auto limit = limits.find(drive.format);

        if (limit != limits.end() && part_size > limit->second.max_file_size())
        {
            reporter.message(
                message_code::error_filesystem_not_allow_size,
                limit->first,
                limit->second.max_amount,
                limit->second.unit_label);
            error_code = file_splitter::error::unsupported_part_size;

            return false;
        }
    }

    return true;
}

std::string capacity_guard::determine_filesystem_format(const std::filesystem::path& path)
{
    std::ifstream mounts_file{"/proc/self/mounts"};

    if (!mounts_file.is_open())
    {
        LOG_WARNING << "Mount table can't be read, filesystem limits are not checked";

        return std::string{};
    }

    const std::string path_string = path.generic_string();
    std::string line, device, mount_point, filesystem_type, best_filesystem_type;
    size_t best_mount_point_length = 0;

    // Each line looks like "/dev/sdb1 /media/usb vfat rw,relatime 0 0"
    while (std::getline(mounts_file, line))
    {
        std::istringstream line_stream{line};

        if (!(line_stream >> device >> mount_point >> filesystem_type))
        {
            continue;
        }

        mount_point = decode_mount_point(mount_point);

        // Mount point has to be the path itself or one of its parents
        bool is_parent = 
            path_string.starts_with(mount_point) &&
            (mount_point == "/" ||
             path_string.size() == mount_point.size() ||
             path_string[mount_point.size()] == '/');

        // The longest matching mount point is the one that actually contains the path
        // Prefer the later entry on equal length as it overmounts the earlier one
        if (is_parent && mount_point.size() >= best_mount_point_length)
        {
            best_mount_point_length = mount_point.size();
            best_filesystem_type = filesystem_type;
        }
    }

    return best_filesystem_type;
}

std::string capacity_guard::decode_mount_point(std::string_view mount_point)
{
    std::string result;
    result.reserve(mount_point.size());

    for (size_t i = 0; i < mount_point.size(); ++i)
    {
        if (mount_point[i] == '\\' && i + 3 < mount_point.size() &&
            mount_point[i + 1] >= '0' && mount_point[i + 1] <= '7' &&
            mount_point[i + 2] >= '0' && mount_point[i + 2] <= '7' &&
            mount_point[i + 3] >= '0' && mount_point[i + 3] <= '7')
        {
            result += static_cast<char>(
                (mount_point[i + 1] - '0') * 64 + (mount_point[i + 2] - '0') * 8 + (mount_point[i + 3] - '0'));
            i += 3;
        }
        else
        {
            result += mount_point[i];
        }
    }

    return result;
}
