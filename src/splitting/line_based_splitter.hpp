#ifndef LINE_BASED_SPLITTER_HPP
#define LINE_BASED_SPLITTER_HPP

//local
#include <splitting/cancellation_token.hpp>
#include <splitting/line_reader.hpp>
#include <splitting/part_namer.hpp>
#include <splitting/part_writer.hpp>
#include <splitting/progress_reporter.hpp>
#include <file_splitter/error.hpp>

//internal
#include <filesystem>
#include <vector>
#include <stdint.h>

// Split a text file into parts of exactly part_size lines except the last one that can hold fewer
class line_based_splitter
{
    public:
        /**
         * @brief Copy lines of the source file into consecutive parts keeping their terminators.
         * Each part starts with the byte order mark of the source if it has one, so parts are
         * in the same encoding as the source. Progress is reported after each line with 0 total parts
         * as the number of parts is unknown until the end of file.
         * Empty source file produces a single empty part (with the byte order mark only, if any).
         *
         * @param error_code operation status in terms of file_splitter::error codes.
         * @param token optional token to interrupt the operation. On cancellation the part that is being
         * written is removed and error::operation_cancelled is set.
         *
         * @return Paths of the parts that were written.
         */
        static std::vector<std::filesystem::path> split(
            const std::filesystem::path& source_file_path,
            uint64_t part_size,
            const part_namer& namer,
            progress_reporter& reporter,
            file_splitter::error_code& error_code,
            const cancellation_token* token = nullptr);

    private:
        // Open the part with given number and write the byte order mark into it
        static bool open_part(
            part_descriptor& part,
            const std::string& signature,
            const part_namer& namer,
            part_writer& writer,
            progress_reporter& reporter,
            file_splitter::error_code& error_code);
};

#endif
