#ifndef PART_WRITER_HPP
#define PART_WRITER_HPP

//local
#include <splitting/progress_reporter.hpp>
#include <file_splitter/error.hpp>

//internal
#include <filesystem>
#include <fstream>
#include <string_view>
#include <utility>
#include <vector>

// Write the sequence of part files one after another and remember their paths
// Every failure is reported with the corresponding message and stored in the error_code given on construction
// The currently open part is closed on destruction
class part_writer
{
    public:
        part_writer(progress_reporter& reporter, file_splitter::error_code& error_code)
            : _reporter{reporter},
              _error_code{error_code}{}

        part_writer(const part_writer& other) = delete;

        // Create the part file, truncating it if it exists
        bool open(const std::filesystem::path& part_path);

        bool write(const char* data, size_t size);

        bool write(std::string_view data)
        {
            return write(data.data(), data.size());
        }

        // Flush and close the current part
        bool close();

        bool is_open() const
        {
            return _part_file.is_open();
        }

        // Close and remove the part that is being written as it is incomplete
        // Parts that were closed before stay on disk
        // Sets file_splitter::error::operation_cancelled
        void discard();

        // Paths of all the parts that were opened, in order
        std::vector<std::filesystem::path> release_part_paths()
        {
            return std::move(_part_paths);
        }

    private:
        void report_creation_failure();

        progress_reporter& _reporter;
        file_splitter::error_code& _error_code;
        std::ofstream _part_file;
        std::vector<std::filesystem::path> _part_paths;
};

#endif
