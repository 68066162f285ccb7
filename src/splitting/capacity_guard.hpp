#ifndef CAPACITY_GUARD_HPP
#define CAPACITY_GUARD_HPP

//local
#include <config.hpp>
#include <splitting/progress_reporter.hpp>
#include <splitting/split_job.hpp>
#include <file_splitter/error.hpp>

//internal
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <stdint.h>

// State of the drive that receives the parts
struct drive_info
{
    uint64_t available_space{0};
    // Filesystem format name as it is used as a key in config::filesystem_limits, e.g. "FAT32" or "ext4"
    std::string format;
};

class capacity_guard
{
    public:
        using limits_table = std::map<std::string, config::filesystem_limit, std::less<>>;

        // Query free space and filesystem format of the drive that holds the given path
        // If the path doesn't exist yet then its nearest existing parent is examined
        // On failure error_code is set and empty drive_info is returned
        static drive_info query_drive_info(
            const std::filesystem::path& path,
            std::error_code& error_code);

        // Verify that the job can be done on the given drive:
        // - part size is not less than config::minimum_part_size (byte mode) and is not 0 (line mode)
        // - free space is greater than the source file size, so there is room for a full copy of the source
        // - part size doesn't exceed the maximum file size of the drive's filesystem (byte mode)
        // Report the corresponding message and return false with error_code set if any check fails
        // Nothing is created on disk
        static bool check(
            uint64_t source_file_size,
            uint64_t part_size,
            operation_mode mode,
            const drive_info& drive,
            progress_reporter& reporter,
            file_splitter::error_code& error_code,
            const limits_table& limits = config::filesystem_limits);

    private:
        // Determine the filesystem type of the mount point that contains the given absolute path
        // Return empty string if the mount table can't be read
        static std::string determine_filesystem_format(const std::filesystem::path& path);

        // Decode octal escapes (\040 for space etc.) that are used in the mount table
        static std::string decode_mount_point(std::string_view mount_point);
};

#endif
