//local
#include "test_helpers.hpp"
#include <logging/logger.hpp>

//internal
#include <string>

namespace fs = std::filesystem;

int test_configured_severity()
{
    config::log_severity = "warning";
    ASSERT_TRUE(get_configured_severity() == logging::trivial::warning);

    config::log_severity = "error";
    ASSERT_TRUE(get_configured_severity() == logging::trivial::error);

    config::log_severity = "verbose";
    ASSERT_TRUE(get_configured_severity() == logging::trivial::debug);

    return 0;
}

// Sinks are set up once per process, so the threshold and the operation tag are checked in a single pass
int test_records_filtered_and_tagged()
{
    const fs::path folder = test_helpers::make_temp_folder("logger");
    config::log_file_path = (folder / "records.log").string();
    config::log_severity = "info";

    LOG_DEBUG << "dropped record";
    LOG_INFO << "record without operation";

    {
        LOG_OPERATION("split data.bin");

        LOG_WARNING << "record of the operation";
    }

    LOG_ERROR << "record after the operation";

    const std::string records = test_helpers::read_file(folder / "records.log");

    ASSERT_TRUE(records.find("dropped record") == std::string::npos);
    ASSERT_TRUE(records.find("] record without operation") != std::string::npos);
    ASSERT_TRUE(records.find("[split data.bin] record of the operation") != std::string::npos);
    ASSERT_TRUE(records.find("] record after the operation") != std::string::npos);
    ASSERT_TRUE(records.find("[split data.bin] record after the operation") == std::string::npos);
    ASSERT_TRUE(records.find("<warning>") != std::string::npos);
    ASSERT_TRUE(records.find("[test_logger.cpp:") != std::string::npos);

    return 0;
}

int main()
{
    RUN_TEST(test_configured_severity);
    RUN_TEST(test_records_filtered_and_tagged);

    return 0;
}
