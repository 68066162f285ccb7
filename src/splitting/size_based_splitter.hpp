#ifndef SIZE_BASED_SPLITTER_HPP
#define SIZE_BASED_SPLITTER_HPP

//local
#include <config.hpp>
#include <splitting/cancellation_token.hpp>
#include <splitting/part_namer.hpp>
#include <splitting/part_writer.hpp>
#include <splitting/progress_reporter.hpp>
#include <file_splitter/error.hpp>

//internal
#include <filesystem>
#include <fstream>
#include <vector>
#include <stdint.h>

// Split a binary file into parts of exactly part_size bytes except the last one that holds the remainder
class size_based_splitter
{
    public:
        // Number of parts that the file of given size is split into
        // Empty file still produces a single empty part
        static uint64_t calculate_parts_number(uint64_t source_file_size, uint64_t part_size);

        /**
         * @brief Copy the source file into consecutive parts by chunks of config::buffer_size bytes
         * (or part_size bytes if it is smaller). Progress is reported after each processed chunk.
         *
         * @param source_file_size the size captured before splitting. No more than this number of bytes is read.
         * If the file turns out to be shorter or longer then error::size_mismatch is set and already written
         * parts are left on disk.
         * @param error_code operation status in terms of file_splitter::error codes.
         * @param token optional token to interrupt the operation. On cancellation the part that is being
         * written is removed and error::operation_cancelled is set.
         *
         * @return Paths of the parts that were written, including the last one on failure.
         */
        static std::vector<std::filesystem::path> split(
            const std::filesystem::path& source_file_path,
            uint64_t source_file_size,
            uint64_t part_size,
            const part_namer& namer,
            progress_reporter& reporter,
            file_splitter::error_code& error_code,
            const cancellation_token* token = nullptr);
};

#endif
