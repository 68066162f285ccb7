#ifndef CONFIG_HPP
#define CONFIG_HPP

//internal
#include <string>
#include <stdint.h>
#include <fstream>
#include <filesystem>
#include <map>
#include <stdexcept>

//external
#include <boost/json.hpp>

namespace json = boost::json;

namespace config
{
    // Maximum file size that a filesystem allows expressed as max_amount * factor bytes
    // unit_label is the human-readable name of the factor to report the limit to the user
    struct filesystem_limit
    {
        uint64_t max_amount;
        uint64_t factor;
        std::string unit_label;

        uint64_t max_file_size() const
        {
            return max_amount * factor;
        }
    };

    inline constexpr uint64_t KILOBYTE = 1024;
    inline constexpr uint64_t MEGABYTE = 1024 * KILOBYTE;
    inline constexpr uint64_t GIGABYTE = 1024 * MEGABYTE;

    // Path to the json config
    inline std::string config_path{"../config.json"};

    inline std::string log_file_path{"file_splitter.log"};
    inline bool console_log_enabled{false};
    // Records below this severity are dropped: trace, debug, info, warning, error or fatal
    inline std::string log_severity{"debug"};
    // Size of the buffer that is used to copy files by chunks
    inline size_t buffer_size{10 * MEGABYTE};
    // The smallest block that any file is read or written with
    inline size_t buffer_unit_size{4 * KILOBYTE};
    // Parts smaller than this number of bytes are rejected in byte mode
    inline uint64_t minimum_part_size{4 * buffer_unit_size};
    // Filesystems with known maximum file size, keyed by the filesystem format name
    // Filesystems that are absent here are considered to have no upper bound
    inline std::map<std::string, filesystem_limit, std::less<>> filesystem_limits
    {
        {"FAT12", {32, MEGABYTE, "Mb"}},
        {"FAT16", {2, GIGABYTE, "Gb"}},
        {"FAT32", {4, GIGABYTE, "Gb"}},
        {"msdos", {2, GIGABYTE, "Gb"}},
        {"vfat", {4, GIGABYTE, "Gb"}}
    };

    // Override the defaults with values from the json config found at the given path
    // Keys that are absent in the file keep their default values
    // Throw std::invalid_argument if the file doesn't exist and boost::system::system_error if it is not valid json
    inline void init(const std::string& path = config_path)
    {
        std::ifstream config_file{path};

        if (!config_file.is_open())
        {
            throw std::invalid_argument{
                "Config file was not found at the specified path: " +
                std::filesystem::absolute(path).string()};
        }

        config_path = path;

        std::string config_data;
        size_t config_file_size = std::filesystem::file_size(path);
        config_data.resize(config_file_size);

        config_file.read(config_data.data(), config_file_size);
        json::object config_json = json::parse(config_data).as_object();

        // Initialize config variables with values from json
        if (config_json.contains("log_file_path"))
        {
            log_file_path = config_json.at("log_file_path").as_string();
        }
        if (config_json.contains("console_log_enabled"))
        {
            console_log_enabled = config_json.at("console_log_enabled").as_bool();
        }
        if (config_json.contains("log_severity"))
        {
            log_severity = config_json.at("log_severity").as_string();
        }
        if (config_json.contains("buffer_size"))
        {
            buffer_size = config_json.at("buffer_size").to_number<size_t>();
        }
        if (config_json.contains("buffer_unit_size"))
        {
            buffer_unit_size = config_json.at("buffer_unit_size").to_number<size_t>();
            minimum_part_size = 4 * buffer_unit_size;
        }
        if (config_json.contains("minimum_part_size"))
        {
            minimum_part_size = config_json.at("minimum_part_size").to_number<uint64_t>();
        }
        if (config_json.contains("filesystem_limits"))
        {
            filesystem_limits.clear();

            for (const auto& [format_name, limit] : config_json.at("filesystem_limits").as_object())
            {
                const json::object& limit_object = limit.as_object();

                filesystem_limits.emplace(
                    std::string{format_name},
                    filesystem_limit{
                        limit_object.at("max_amount").to_number<uint64_t>(),
                        limit_object.at("factor").to_number<uint64_t>(),
                        std::string{limit_object.at("unit_label").as_string()}});
            }
        }
    }
}

#endif
