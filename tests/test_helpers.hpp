#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

//local
#include <config.hpp>

//internal
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

#define RUN_TEST(test) if (int result = test(); result != 0) { std::cerr << #test << " failed" << std::endl; return result; }

namespace test_helpers
{
    // Create an empty folder for the test in the system temporary folder
    // Log records of the test go there too
    inline std::filesystem::path make_temp_folder(const std::string& name)
    {
        auto folder = std::filesystem::temp_directory_path() / ("file_splitter_" + name);
        std::filesystem::remove_all(folder);
        std::filesystem::create_directories(folder);

        config::log_file_path = (std::filesystem::temp_directory_path() / "file_splitter_tests.log").string();

        return folder;
    }

    inline void write_file(const std::filesystem::path& path, const std::string& content)
    {
        std::ofstream file{path, std::ios::binary | std::ios::trunc};
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    inline std::string read_file(const std::filesystem::path& path)
    {
        std::ifstream file{path, std::ios::binary};

        return std::string{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    }

    // Deterministic binary content that doesn't repeat with small periods
    inline std::string make_binary_data(size_t size)
    {
        std::string data(size, char());

        for (size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<char>((i * 31 + i / 251) & 0xFF);
        }

        return data;
    }

    inline std::string concatenate_files(const std::vector<std::filesystem::path>& paths)
    {
        std::string result;

        for (const auto& path : paths)
        {
            result += read_file(path);
        }

        return result;
    }

    inline size_t count_files(const std::filesystem::path& folder)
    {
        if (!std::filesystem::exists(folder))
        {
            return 0;
        }

        return static_cast<size_t>(std::distance(
            std::filesystem::directory_iterator{folder}, 
            std::filesystem::directory_iterator{}));
    }
}

#endif
