#include <splitting/split_job_runner.hpp>

//internal
#include <stdexcept>

//external
#include <boost/scope_exit.hpp>

std::vector<std::filesystem::path> split_job_runner::run(
    file_splitter::error_code& error_code, 
    const cancellation_token* token)
{
    if (_state != split_state::not_started)
    {
        throw std::logic_error{"Split job can't be run more than once"};
    }

    error_code.clear();

    progress_reporter reporter{_observer};

    reporter.start();

    // Notify about the end of the operation on any exit path
    // The state can't stay intermediate if an exception leaves the function
    BOOST_SCOPE_EXIT_ALL(&)
    {
        if (_state != split_state::succeeded)
        {
            set_state(split_state::failed);
        }

        reporter.finish();
    };

    LOG_INFO << "Splitting " << _job.source_file_path.string() << " by " 
        << magic_enum::enum_name(_job.mode) << " into parts of " << _job.part_size;

    set_state(split_state::validating);

    uint64_t source_file_size = 0;
    std::optional<part_namer> namer = validate(reporter, error_code, source_file_size);

    if (!namer.has_value())
    {
        LOG_ERROR << "Validation failed: " << error_code.message();

        return std::vector<std::filesystem::path>{};
    }

    set_state(split_state::splitting);

    std::vector<std::filesystem::path> part_paths;

    if (_job.mode == operation_mode::by_bytes)
    {
        part_paths = size_based_splitter::split(
            _job.source_file_path, 
            source_file_size, 
            _job.part_size, 
            namer.value(), 
            reporter, 
            error_code, 
            token);
    }
    else
    {
        part_paths = line_based_splitter::split(
            _job.source_file_path, 
            _job.part_size, 
            namer.value(), 
            reporter, 
            error_code, 
            token);
    }

    if (error_code)
    {
        LOG_ERROR << "Splitting failed after " << part_paths.size() << " parts: " << error_code.message();

        return part_paths;
    }

    set_state(split_state::finalizing);

    if (!finalize(reporter, error_code))
    {
        return part_paths;
    }

    set_state(split_state::succeeded);

    LOG_INFO << _job.source_file_path.string() << " was split into " << part_paths.size() << " parts";

    return part_paths;
}

std::optional<part_namer> split_job_runner::validate(
    progress_reporter& reporter, 
    file_splitter::error_code& error_code,
    uint64_t& source_file_size)
{
    std::error_code filesystem_error_code;

    if (!std::filesystem::is_regular_file(_job.source_file_path, filesystem_error_code))
    {
        reporter.message(message_code::error_opening_file, _job.source_file_path.string());
        error_code = file_splitter::error::source_open_failure;

        return std::nullopt;
    }

    source_file_size = std::filesystem::file_size(_job.source_file_path, filesystem_error_code);

    if (filesystem_error_code)
    {
        reporter.message(message_code::error_opening_file, _job.source_file_path.string());
        error_code = file_splitter::error::source_open_failure;

        return std::nullopt;
    }

    // Total parts are unknown in line mode without reading the whole file
    const uint64_t total_parts = _job.mode == operation_mode::by_bytes ?
        size_based_splitter::calculate_parts_number(source_file_size, _job.part_size) : 0;

    part_namer namer{_job, total_parts};

    const drive_info drive = _drive_info_provider(namer.get_destination_folder(), filesystem_error_code);

    if (filesystem_error_code)
    {
        LOG_ERROR << filesystem_error_code.message();

        reporter.message(message_code::error_creating_file, namer.get_destination_folder().string());
        error_code = file_splitter::error::destination_create_failure;

        return std::nullopt;
    }

    LOG_DEBUG << "Destination drive: " << drive.available_space << " bytes available, format '" << drive.format << "'";

    if (!capacity_guard::check(source_file_size, _job.part_size, _job.mode, drive, reporter, error_code))
    {
        return std::nullopt;
    }

    if (!namer.verify_pattern(reporter, error_code))
    {
        return std::nullopt;
    }

    if (!namer.create_destination_folder(reporter, error_code))
    {
        return std::nullopt;
    }

    return namer;
}

bool split_job_runner::finalize(progress_reporter& reporter, file_splitter::error_code& error_code)
{
    if (!_job.delete_original_file)
    {
        return true;
    }

    std::error_code filesystem_error_code;
    std::filesystem::file_status source_status = std::filesystem::status(_job.source_file_path, filesystem_error_code);

    // Read-only source file is left in place
    if (!filesystem_error_code && 
        (source_status.permissions() & std::filesystem::perms::owner_write) == std::filesystem::perms::none)
    {
        LOG_INFO << _job.source_file_path.string() << " is read-only and is not deleted";

        return true;
    }

    if (filesystem_error_code || !std::filesystem::remove(_job.source_file_path, filesystem_error_code))
    {
        LOG_ERROR << filesystem_error_code.message();

        reporter.message(message_code::error_deleting_source_file, _job.source_file_path.string());
        error_code = file_splitter::error::source_delete_failure;

        return false;
    }

    reporter.message(message_code::info_source_file_deleted, _job.source_file_path.string());

    return true;
}

void split_job_runner::set_state(split_state state)
{
    LOG_DEBUG << _job.source_file_path.string() << ": " 
        << magic_enum::enum_name(_state) << " -> " << magic_enum::enum_name(state);

    _state = state;
}
