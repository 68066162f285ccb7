#include <splitting/part_writer.hpp>

bool part_writer::open(const std::filesystem::path& part_path)
{
    _part_file.open(part_path, std::ios::binary | std::ios::trunc);

    if (!_part_file.is_open())
    {
        _reporter.message(message_code::error_creating_file, part_path.string());
        _error_code = file_splitter::error::destination_create_failure;

        return false;
    }

    _part_paths.emplace_back(part_path);

    return true;
}

bool part_writer::write(const char* data, size_t size)
{
    if (!_part_file.write(data, static_cast<std::streamsize>(size)))
    {
        report_creation_failure();

        return false;
    }

    return true;
}

bool part_writer::close()
{
    _part_file.flush();
    _part_file.close();

    // Buffered data could fail to be written only now
    if (_part_file.fail())
    {
        report_creation_failure();

        return false;
    }

    return true;
}

void part_writer::discard()
{
    _error_code = file_splitter::error::operation_cancelled;

    if (!_part_file.is_open() || _part_paths.empty())
    {
        _reporter.message(message_code::info_operation_cancelled, std::string{});

        return;
    }

    _part_file.close();

    const std::filesystem::path discarded_path = _part_paths.back();
    _part_paths.pop_back();

    std::error_code filesystem_error_code;
    std::filesystem::remove(discarded_path, filesystem_error_code);

    if (filesystem_error_code)
    {
        LOG_ERROR << filesystem_error_code.message();
    }

    _reporter.message(message_code::info_operation_cancelled, discarded_path.string());
}

void part_writer::report_creation_failure()
{
    _reporter.message(
        message_code::error_creating_file, 
        _part_paths.empty() ? std::string{} : _part_paths.back().string());
    _error_code = file_splitter::error::destination_create_failure;
}
