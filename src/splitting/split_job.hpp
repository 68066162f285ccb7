#ifndef SPLIT_JOB_HPP
#define SPLIT_JOB_HPP

//internal
#include <filesystem>
#include <optional>
#include <string>
#include <stdint.h>

enum class operation_mode
{
    by_bytes,
    by_lines
};

enum class split_state
{
    not_started,
    validating,
    splitting,
    finalizing,
    succeeded,
    failed
};

// Parameters of a single split operation
// The job is consumed by exactly one run and is not modified once it is started
struct split_job
{
    std::filesystem::path source_file_path;
    // Bytes per part in byte mode, lines per part in line mode
    uint64_t part_size{0};
    operation_mode mode{operation_mode::by_bytes};
    // Folder to place parts in, if empty then parts are placed beside the source file
    std::optional<std::filesystem::path> destination_folder;
    // std::format pattern where {0} is the current part number and {1} is the total parts number
    // If empty then the pattern is generated from the source file name
    std::optional<std::string> file_name_pattern;
    bool delete_original_file{false};
    // File that receives every generated part name on a separate line
    std::optional<std::filesystem::path> generation_log_file_path;
};

// The part that is being written at the moment
struct part_descriptor
{
    std::filesystem::path file_path;
    // 1-based
    uint64_t number{1};
    // Known in advance only in byte mode, in line mode it is 0
    uint64_t total_parts{0};
    // Bytes or lines depending on the operation mode
    uint64_t written{0};
};

// Reported after each chunk (byte mode) or line (line mode) with the part that received it
// A part that has just been completed is reported as is, with written_in_part equal to part_size,
// the next part appears in the event of the first chunk or line written into it
struct progress_event
{
    std::filesystem::path file_path;
    uint64_t part_number;
    uint64_t written_in_part;
    uint64_t total_parts;
    uint64_t part_size;
};

#endif
