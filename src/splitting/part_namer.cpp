#include <splitting/part_namer.hpp>

//internal
#include <fstream>

part_namer::part_namer(const split_job& job, uint64_t total_parts)
    : _source_file_path{job.source_file_path},
      _generation_log_file_path{job.generation_log_file_path},
      _total_parts{total_parts}
{
    if (job.file_name_pattern.has_value() && !job.file_name_pattern->empty())
    {
        _pattern = job.file_name_pattern.value();
    }
    else
    {
        _pattern = generate_default_pattern(job.source_file_path, total_parts);
    }

    if (job.destination_folder.has_value() && !job.destination_folder->empty())
    {
        _destination_folder = job.destination_folder.value();
    }
    else
    {
        _destination_folder = job.source_file_path.parent_path();
    }

    // Source file given by a bare name lives in the current folder
    if (_destination_folder.empty())
    {
        _destination_folder = ".";
    }
}

std::string part_namer::generate_default_pattern(
    const std::filesystem::path& source_file_path, 
    uint64_t total_parts)
{
    // Use the total parts string length (e.g. 123 -> 3) to determine the amount of padding needed
    const size_t width = std::to_string(total_parts).size();

    // Braces in the file name itself have to be escaped to not be taken as replacement fields
    auto escape_braces = 
        [](const std::string& text)
        {
            std::string escaped;
            escaped.reserve(text.size());

            for (char symbol : text)
            {
                if (symbol == '{' || symbol == '}')
                {
                    escaped += symbol;
                }

                escaped += symbol;
            }

            return escaped;
        };

    return std::format(
        "{0}_{{0:0{1}}}({{1:0{1}}}){2}",
        escape_braces(source_file_path.stem().string()),
        width,
        escape_braces(source_file_path.extension().string()));
}

bool part_namer::verify_pattern(progress_reporter& reporter, file_splitter::error_code& error_code) const
{
    try
    {
        // Pattern that ignores the part number would make all parts overwrite the same file
        // In line mode the total is unknown so it is checked too
        if (_total_parts != 1 && format_file_name(1) == format_file_name(2))
        {
            reporter.message(message_code::error_invalid_name_pattern, _pattern);
            error_code = file_splitter::error::invalid_name_pattern;

            return false;
        }

        if (format_file_name(1).empty())
        {
            reporter.message(message_code::error_invalid_name_pattern, _pattern);
            error_code = file_splitter::error::invalid_name_pattern;

            return false;
        }

        // Parts in between are checked on generation, in line mode the last one is unknown
        if (is_source_file(_destination_folder / format_file_name(1)) ||
            (_total_parts > 1 && is_source_file(_destination_folder / format_file_name(_total_parts))))
        {
            LOG_ERROR << "Pattern " << _pattern << " overwrites the source file " << _source_file_path.string();

            reporter.message(message_code::error_invalid_name_pattern, _pattern);
            error_code = file_splitter::error::invalid_name_pattern;

            return false;
        }
    }
    catch (const std::format_error& ex)
    {
        LOG_ERROR << ex.what();

        reporter.message(message_code::error_invalid_name_pattern, _pattern);
        error_code = file_splitter::error::invalid_name_pattern;

        return false;
    }

    return true;
}

bool part_namer::create_destination_folder(progress_reporter& reporter, file_splitter::error_code& error_code) const
{
    std::error_code filesystem_error_code;

    // Returns false without error if the folder already exists
    std::filesystem::create_directories(_destination_folder, filesystem_error_code);

    if (filesystem_error_code || !std::filesystem::is_directory(_destination_folder))
    {
        LOG_ERROR << filesystem_error_code.message();

        reporter.message(message_code::error_creating_file, _destination_folder.string());
        error_code = file_splitter::error::destination_create_failure;

        return false;
    }

    return true;
}

std::filesystem::path part_namer::get_part_path(
    uint64_t part_number, 
    progress_reporter& reporter, 
    file_splitter::error_code& error_code) const
{
    std::string file_name;

    try
    {
        file_name = format_file_name(part_number);
    }
    catch (const std::format_error& ex)
    {
        LOG_ERROR << ex.what();

        reporter.message(message_code::error_invalid_name_pattern, _pattern);
        error_code = file_splitter::error::invalid_name_pattern;

        return std::filesystem::path{};
    }

    std::filesystem::path part_path = _destination_folder / file_name;

    if (is_source_file(part_path))
    {
        LOG_ERROR << "Part " << part_number << " overwrites the source file " << _source_file_path.string();

        reporter.message(message_code::error_invalid_name_pattern, _pattern);
        error_code = file_splitter::error::invalid_name_pattern;

        return std::filesystem::path{};
    }

    if (!register_created_file(file_name, reporter, error_code))
    {
        return std::filesystem::path{};
    }

    return part_path;
}

std::string part_namer::format_file_name(uint64_t part_number) const
{
    return std::vformat(_pattern, std::make_format_args(part_number, _total_parts));
}

bool part_namer::is_source_file(const std::filesystem::path& part_path) const
{
    // Fails with an error if the part doesn't exist yet, so it can't be the source
    std::error_code filesystem_error_code;

    return std::filesystem::equivalent(part_path, _source_file_path, filesystem_error_code);
}

bool part_namer::register_created_file(
    const std::string& file_name, 
    progress_reporter& reporter, 
    file_splitter::error_code& error_code) const
{
    if (!_generation_log_file_path.has_value())
    {
        return true;
    }

    std::ofstream generation_log{_generation_log_file_path.value(), std::ios::app};

    if (!generation_log.is_open() || !(generation_log << file_name << '\n'))
    {
        reporter.message(message_code::error_writing_generation_log, _generation_log_file_path->string());
        error_code = file_splitter::error::generation_log_failure;

        return false;
    }

    return true;
}
