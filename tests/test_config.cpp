//local
#include "test_helpers.hpp"
#include <config.hpp>
#include <splitting/split_unit.hpp>

//internal
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

int test_defaults()
{
    ASSERT_TRUE(config::log_severity == "debug");
    ASSERT_TRUE(config::buffer_size == 10 * config::MEGABYTE);
    ASSERT_TRUE(config::buffer_unit_size == 4 * config::KILOBYTE);
    ASSERT_TRUE(config::minimum_part_size == 16 * config::KILOBYTE);
    ASSERT_TRUE(config::filesystem_limits.at("FAT32").max_file_size() == 4 * config::GIGABYTE);
    ASSERT_TRUE(config::filesystem_limits.at("FAT16").max_file_size() == 2 * config::GIGABYTE);
    ASSERT_TRUE(config::filesystem_limits.at("FAT12").max_file_size() == 32 * config::MEGABYTE);
    ASSERT_TRUE(config::filesystem_limits.at("vfat").unit_label == "Gb");
    ASSERT_TRUE(config::filesystem_limits.count("ext4") == 0);

    return 0;
}

int test_init_overrides_present_keys()
{
    const fs::path folder = test_helpers::make_temp_folder("config_init");
    const std::string log_file_path = (folder / "custom.log").string();

    test_helpers::write_file(folder / "config.json", 
        "{\n"
        "    \"log_file_path\": \"" + log_file_path + "\",\n"
        "    \"log_severity\": \"error\",\n"
        "    \"buffer_size\": 65536,\n"
        "    \"buffer_unit_size\": 512,\n"
        "    \"filesystem_limits\": {\n"
        "        \"exfat\": {\"max_amount\": 16, \"factor\": 1099511627776, \"unit_label\": \"Tb\"}\n"
        "    }\n"
        "}\n");

    config::init((folder / "config.json").string());

    ASSERT_TRUE(config::config_path == (folder / "config.json").string());
    ASSERT_TRUE(config::log_file_path == log_file_path);
    ASSERT_TRUE(config::log_severity == "error");
    ASSERT_TRUE(config::buffer_size == 65536);
    ASSERT_TRUE(config::buffer_unit_size == 512);
    // Follows the unit size if it is not set explicitly
    ASSERT_TRUE(config::minimum_part_size == 2048);
    // Absent keys keep their values
    ASSERT_TRUE(!config::console_log_enabled);
    // The table is replaced as a whole
    ASSERT_TRUE(config::filesystem_limits.size() == 1);
    ASSERT_TRUE(config::filesystem_limits.at("exfat").max_amount == 16);
    ASSERT_TRUE(config::filesystem_limits.at("exfat").unit_label == "Tb");

    test_helpers::write_file(folder / "minimum.json", "{\"minimum_part_size\": 1000}");
    config::init((folder / "minimum.json").string());

    ASSERT_TRUE(config::minimum_part_size == 1000);
    ASSERT_TRUE(config::buffer_size == 65536);

    fs::remove_all(folder);

    return 0;
}

int test_init_missing_file()
{
    bool is_thrown = false;

    try
    {
        config::init((fs::temp_directory_path() / "file_splitter_missing_config.json").string());
    }
    catch (const std::invalid_argument&)
    {
        is_thrown = true;
    }

    ASSERT_TRUE(is_thrown);

    return 0;
}

int test_split_units()
{
    ASSERT_TRUE(parse_split_unit("Bytes") == split_unit::Bytes);
    ASSERT_TRUE(parse_split_unit("megabytes") == split_unit::MegaBytes);
    ASSERT_TRUE(parse_split_unit("GIGABYTES") == split_unit::GigaBytes);
    ASSERT_TRUE(parse_split_unit("Lines") == split_unit::Lines);
    ASSERT_TRUE(!parse_split_unit("Petabytes").has_value());
    ASSERT_TRUE(!parse_split_unit("").has_value());

    ASSERT_TRUE(get_split_unit_factor(split_unit::Bytes) == 1);
    ASSERT_TRUE(get_split_unit_factor(split_unit::KiloBytes) == 1024);
    ASSERT_TRUE(get_split_unit_factor(split_unit::MegaBytes) == 1048576);
    ASSERT_TRUE(get_split_unit_factor(split_unit::GigaBytes) == 1073741824);
    ASSERT_TRUE(get_split_unit_factor(split_unit::Lines) == 1);

    return 0;
}

int main()
{
    RUN_TEST(test_defaults);
    RUN_TEST(test_init_overrides_present_keys);
    RUN_TEST(test_init_missing_file);
    RUN_TEST(test_split_units);

    return 0;
}
