#include <joining/part_joiner.hpp>

//internal
#include <fstream>

//external
#include <boost/scope_exit.hpp>

std::vector<std::filesystem::path> part_joiner::read_generation_log(
    const std::filesystem::path& generation_log_file_path,
    const std::filesystem::path& parts_folder,
    file_splitter::error_code& error_code)
{
    std::vector<std::filesystem::path> part_paths;
    std::ifstream generation_log{generation_log_file_path};

    if (!generation_log.is_open())
    {
        LOG_ERROR << "Generation log " << generation_log_file_path.string() << " can't be opened";

        error_code = file_splitter::error::source_open_failure;

        return part_paths;
    }

    std::string file_name;

    while (std::getline(generation_log, file_name))
    {
        // Log could be written with \r\n line endings
        if (!file_name.empty() && file_name.back() == '\r')
        {
            file_name.pop_back();
        }

        if (!file_name.empty())
        {
            part_paths.emplace_back(parts_folder / file_name);
        }
    }

    return part_paths;
}

uint64_t part_joiner::join(
    const std::vector<std::filesystem::path>& part_paths,
    const std::filesystem::path& output_file_path,
    const split_observer& observer,
    file_splitter::error_code& error_code,
    const cancellation_token* token)
{
    error_code.clear();

    progress_reporter reporter{observer};

    reporter.start();

    BOOST_SCOPE_EXIT_ALL(&reporter)
    {
        reporter.finish();
    };

    // Remove the incomplete output so it can't be mistaken for the joined file
    auto remove_output_file = 
        [&output_file_path](std::ofstream& output_file)
        {
            output_file.close();

            std::error_code filesystem_error_code;
            std::filesystem::remove(output_file_path, filesystem_error_code);

            if (filesystem_error_code)
            {
                LOG_ERROR << filesystem_error_code.message();
            }
        };

    std::ofstream output_file{output_file_path, std::ios::binary | std::ios::trunc};

    if (!output_file.is_open())
    {
        reporter.message(message_code::error_creating_file, output_file_path.string());
        error_code = file_splitter::error::destination_create_failure;

        return 0;
    }

    std::string buffer(config::buffer_size ? config::buffer_size : config::buffer_unit_size, char());
    uint64_t bytes_in_total = 0;

    for (size_t i = 0; i < part_paths.size(); ++i)
    {
        std::ifstream part_file{part_paths[i], std::ios::binary};

        if (!part_file.is_open())
        {
            remove_output_file(output_file);

            reporter.message(message_code::error_opening_file, part_paths[i].string());
            error_code = file_splitter::error::source_open_failure;

            return 0;
        }

        std::error_code filesystem_error_code;
        const uint64_t part_size = std::filesystem::file_size(part_paths[i], filesystem_error_code);
        uint64_t bytes_in_part = 0;

        while (size_t bytes_in_buffer = part_file.read(buffer.data(), buffer.size()).gcount())
        {
            if (token && token->is_cancelled())
            {
                remove_output_file(output_file);

                reporter.message(message_code::info_operation_cancelled, output_file_path.string());
                error_code = file_splitter::error::operation_cancelled;

                return 0;
            }

            if (!output_file.write(buffer.data(), static_cast<std::streamsize>(bytes_in_buffer)))
            {
                remove_output_file(output_file);

                reporter.message(message_code::error_creating_file, output_file_path.string());
                error_code = file_splitter::error::destination_create_failure;

                return 0;
            }

            bytes_in_part += bytes_in_buffer;
            bytes_in_total += bytes_in_buffer;

            reporter.progress(progress_event{
                part_paths[i], 
                i + 1, 
                bytes_in_part, 
                part_paths.size(), 
                filesystem_error_code ? bytes_in_part : part_size});
        }

        if (part_file.bad())
        {
            remove_output_file(output_file);

            reporter.message(message_code::error_opening_file, part_paths[i].string());
            error_code = file_splitter::error::source_open_failure;

            return 0;
        }
    }

    output_file.flush();
    output_file.close();

    if (output_file.fail())
    {
        remove_output_file(output_file);

        reporter.message(message_code::error_creating_file, output_file_path.string());
        error_code = file_splitter::error::destination_create_failure;

        return 0;
    }

    LOG_INFO << part_paths.size() << " parts were joined into " << output_file_path.string() 
        << " (" << bytes_in_total << " bytes)";

    return bytes_in_total;
}
