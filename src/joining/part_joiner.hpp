#ifndef PART_JOINER_HPP
#define PART_JOINER_HPP

//local
#include <config.hpp>
#include <splitting/cancellation_token.hpp>
#include <splitting/progress_reporter.hpp>
#include <file_splitter/error.hpp>

//internal
#include <filesystem>
#include <vector>
#include <stdint.h>

// Reassemble parts produced by splitting back into a single file
class part_joiner
{
    public:
        // Read part file names from the generation log, one per line, resolving them against the folder
        // Empty lines are skipped
        // On failure error_code is set to file_splitter::error::source_open_failure and empty vector is returned
        static std::vector<std::filesystem::path> read_generation_log(
            const std::filesystem::path& generation_log_file_path,
            const std::filesystem::path& parts_folder,
            file_splitter::error_code& error_code);

        /**
         * @brief Concatenate the parts in the given order into the output file by chunks of
         * config::buffer_size bytes. Start and finish notifications are delivered exactly once,
         * progress is reported after each chunk with the part number, the bytes copied from this part,
         * the total number of parts and the part size.
         *
         * @param error_code operation status in terms of file_splitter::error codes.
         * @param token optional token to interrupt the operation. On cancellation the output file is removed.
         *
         * @return Number of bytes written to the output file.
         */
        static uint64_t join(
            const std::vector<std::filesystem::path>& part_paths,
            const std::filesystem::path& output_file_path,
            const split_observer& observer,
            file_splitter::error_code& error_code,
            const cancellation_token* token = nullptr);
};

#endif
