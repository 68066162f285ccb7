#ifndef PART_NAMER_HPP
#define PART_NAMER_HPP

//local
#include <splitting/progress_reporter.hpp>
#include <splitting/split_job.hpp>
#include <file_splitter/error.hpp>

//internal
#include <filesystem>
#include <optional>
#include <string>
#include <stdint.h>

// Generate part file paths of a single job from the file name pattern
// Pattern uses std::format syntax: {0} is the current part number and {1} is the total parts number
class part_namer
{
    public:
        // Use the job's pattern or generate the default one if the job doesn't have it
        // Parts are placed to the job's destination folder or beside the source file
        part_namer(const split_job& job, uint64_t total_parts);

        // Build the pattern from the source file name padding both numbers with zeros 
        // up to the number of digits in total_parts
        // Example: "data.bin" with 123 parts -> "data_{0:03}({1:03}).bin" -> "data_001(123).bin"
        static std::string generate_default_pattern(
            const std::filesystem::path& source_file_path, 
            uint64_t total_parts);

        // Check that the pattern can be formatted with part numbers, gives distinct names
        // and doesn't point the first or the last part to the source file
        bool verify_pattern(progress_reporter& reporter, file_splitter::error_code& error_code) const;

        // Create the destination folder with all its parents if it doesn't exist
        bool create_destination_folder(progress_reporter& reporter, file_splitter::error_code& error_code) const;

        // Generate the path of the part with given number and append its file name to the generation log
        // Return empty path and set error_code on failure, including the path of the source file itself
        std::filesystem::path get_part_path(
            uint64_t part_number, 
            progress_reporter& reporter, 
            file_splitter::error_code& error_code) const;

        // Only format the file name without registering it
        // Throw std::format_error if the pattern is invalid
        std::string format_file_name(uint64_t part_number) const;

        const std::string& get_pattern() const
        {
            return _pattern;
        }

        const std::filesystem::path& get_destination_folder() const
        {
            return _destination_folder;
        }

    private:
        // The part would overwrite the file that is being split
        bool is_source_file(const std::filesystem::path& part_path) const;

        // Append the file name as a separate line to the generation log if it is configured
        bool register_created_file(
            const std::string& file_name, 
            progress_reporter& reporter, 
            file_splitter::error_code& error_code) const;

        std::string _pattern;
        std::filesystem::path _source_file_path;
        std::filesystem::path _destination_folder;
        std::optional<std::filesystem::path> _generation_log_file_path;
        uint64_t _total_parts;
};

#endif
