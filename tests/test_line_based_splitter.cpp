//local
#include "test_helpers.hpp"
#include <splitting/line_based_splitter.hpp>

//internal
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace
{
    struct split_result
    {
        std::vector<fs::path> part_paths;
        file_splitter::error_code error_code;
        std::vector<progress_event> events;
    };

    split_result split_file(const fs::path& source_file_path, uint64_t part_size, const cancellation_token* token = nullptr)
    {
        split_result result;

        split_job job;
        job.source_file_path = source_file_path;
        job.part_size = part_size;
        job.mode = operation_mode::by_lines;

        part_namer namer{job, 0};
        progress_reporter reporter{split_observer{
            .on_progress = [&result](const progress_event& event){ result.events.push_back(event); }}};

        result.part_paths = line_based_splitter::split(
            source_file_path, part_size, namer, reporter, result.error_code, token);

        return result;
    }

    std::string make_lines(size_t first, size_t last, const std::string& terminator = "\n")
    {
        std::string text;

        for (size_t i = first; i <= last; ++i)
        {
            text += "line " + std::to_string(i) + terminator;
        }

        return text;
    }
}

int test_split_with_remainder()
{
    const fs::path folder = test_helpers::make_temp_folder("line_split_remainder");
    test_helpers::write_file(folder / "text.txt", make_lines(1, 7));

    split_result result = split_file(folder / "text.txt", 3);

    ASSERT_TRUE(!result.error_code);
    ASSERT_TRUE(result.part_paths.size() == 3);
    ASSERT_TRUE(result.part_paths[0] == folder / "text_1(0).txt");
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[0]) == make_lines(1, 3));
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[1]) == make_lines(4, 6));
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[2]) == make_lines(7, 7));

    // Progress after each line, the total is unknown
    ASSERT_TRUE(result.events.size() == 7);
    // Completed part is reported before the next one appears
    ASSERT_TRUE(result.events[2].part_number == 1);
    ASSERT_TRUE(result.events[2].written_in_part == 3);
    ASSERT_TRUE(result.events[2].file_path == result.part_paths[0]);
    ASSERT_TRUE(result.events[3].part_number == 2);
    ASSERT_TRUE(result.events[3].written_in_part == 1);
    ASSERT_TRUE(result.events[6].part_number == 3);

    for (const progress_event& event : result.events)
    {
        ASSERT_TRUE(event.total_parts == 0);
        ASSERT_TRUE(event.part_size == 3);
    }

    fs::remove_all(folder);

    return 0;
}

int test_split_exact_multiple()
{
    const fs::path folder = test_helpers::make_temp_folder("line_split_exact");
    test_helpers::write_file(folder / "text.txt", make_lines(1, 6));

    split_result result = split_file(folder / "text.txt", 3);

    ASSERT_TRUE(!result.error_code);
    // No empty trailing part
    ASSERT_TRUE(result.part_paths.size() == 2);
    ASSERT_TRUE(test_helpers::count_files(folder) == 3);
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[1]) == make_lines(4, 6));

    fs::remove_all(folder);

    return 0;
}

int test_split_empty_file()
{
    const fs::path folder = test_helpers::make_temp_folder("line_split_empty");
    test_helpers::write_file(folder / "empty.txt", "");

    split_result result = split_file(folder / "empty.txt", 10);

    ASSERT_TRUE(!result.error_code);
    ASSERT_TRUE(result.part_paths.size() == 1);
    ASSERT_TRUE(fs::file_size(result.part_paths[0]) == 0);

    fs::remove_all(folder);

    return 0;
}

int test_terminators_are_preserved()
{
    const fs::path folder = test_helpers::make_temp_folder("line_split_terminators");
    const std::string text = "alpha\r\nbeta\r\ngamma\rdelta\nepsilon";
    test_helpers::write_file(folder / "text.txt", text);

    split_result result = split_file(folder / "text.txt", 2);

    ASSERT_TRUE(!result.error_code);
    ASSERT_TRUE(result.part_paths.size() == 3);
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[0]) == "alpha\r\nbeta\r\n");
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[1]) == "gamma\rdelta\n");
    // Last line without terminator stays so
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[2]) == "epsilon");
    ASSERT_TRUE(test_helpers::concatenate_files(result.part_paths) == text);

    fs::remove_all(folder);

    return 0;
}

int test_utf8_signature_in_every_part()
{
    const fs::path folder = test_helpers::make_temp_folder("line_split_utf8");
    const std::string signature{"\xEF\xBB\xBF"};
    test_helpers::write_file(folder / "text.txt", signature + make_lines(1, 5));

    split_result result = split_file(folder / "text.txt", 2);

    ASSERT_TRUE(!result.error_code);
    ASSERT_TRUE(result.part_paths.size() == 3);
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[0]) == signature + make_lines(1, 2));
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[1]) == signature + make_lines(3, 4));
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[2]) == signature + make_lines(5, 5));

    fs::remove_all(folder);

    return 0;
}

int test_utf16_signature_in_every_part()
{
    const fs::path folder = test_helpers::make_temp_folder("line_split_utf16");
    const std::string signature{"\xFF\xFE", 2};
    const std::string first_line{"1\0\n\0", 4};
    const std::string second_line{"2\0\r\0\n\0", 6};
    const std::string third_line{"3\0", 2};
    test_helpers::write_file(folder / "text.txt", signature + first_line + second_line + third_line);

    split_result result = split_file(folder / "text.txt", 2);

    ASSERT_TRUE(!result.error_code);
    ASSERT_TRUE(result.part_paths.size() == 2);
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[0]) == signature + first_line + second_line);
    ASSERT_TRUE(test_helpers::read_file(result.part_paths[1]) == signature + third_line);

    fs::remove_all(folder);

    return 0;
}

int test_missing_source()
{
    const fs::path folder = test_helpers::make_temp_folder("line_split_missing");

    split_result result = split_file(folder / "missing.txt", 2);

    ASSERT_TRUE(result.error_code == file_splitter::error::source_open_failure);
    ASSERT_TRUE(result.part_paths.empty());
    ASSERT_TRUE(test_helpers::count_files(folder) == 0);

    fs::remove_all(folder);

    return 0;
}

int test_cancellation()
{
    const fs::path folder = test_helpers::make_temp_folder("line_split_cancellation");
    test_helpers::write_file(folder / "text.txt", make_lines(1, 10));

    cancellation_token token;
    token.cancel();

    split_result result = split_file(folder / "text.txt", 3, &token);

    ASSERT_TRUE(result.error_code == file_splitter::error::operation_cancelled);
    ASSERT_TRUE(result.part_paths.empty());
    // Only the source is left
    ASSERT_TRUE(test_helpers::count_files(folder) == 1);

    fs::remove_all(folder);

    return 0;
}

int main()
{
    RUN_TEST(test_split_with_remainder);
    RUN_TEST(test_split_exact_multiple);
    RUN_TEST(test_split_empty_file);
    RUN_TEST(test_terminators_are_preserved);
    RUN_TEST(test_utf8_signature_in_every_part);
    RUN_TEST(test_utf16_signature_in_every_part);
    RUN_TEST(test_missing_source);
    RUN_TEST(test_cancellation);

    return 0;
}
