#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

//local
#include <splitting/split_job.hpp>

//internal
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cli
{
    enum exit_code : int
    {
        SUCCESS = 0,
        OPERATION_FAILED = 1,
        USAGE_ERROR = 2
    };

    struct join_request
    {
        std::filesystem::path output_file_path;
        std::vector<std::filesystem::path> part_paths;
        std::optional<std::filesystem::path> generation_log_file_path;
        // Folder to resolve names from the generation log against, the log's folder by default
        std::optional<std::filesystem::path> parts_folder;
    };

    // Build the split job from "split" command arguments (without the command name itself)
    // Part size is multiplied by the unit factor, unit Lines switches the job to line mode
    // Throw std::invalid_argument or boost::program_options::error on invalid arguments
    split_job parse_split_arguments(const std::vector<std::string>& arguments);

    // Build the join request from "join" command arguments (without the command name itself)
    // Throw std::invalid_argument or boost::program_options::error on invalid arguments
    join_request parse_join_arguments(const std::vector<std::string>& arguments);

    // Parse the command line, load the config, run the command and render its progress on the console
    // Return one of exit_code values
    int run(int argc, char* argv[]);
}

#endif
