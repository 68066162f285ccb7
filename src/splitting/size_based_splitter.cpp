#include <splitting/size_based_splitter.hpp>

uint64_t size_based_splitter::calculate_parts_number(uint64_t source_file_size, uint64_t part_size)
{
    if (part_size == 0 || source_file_size <= part_size)
    {
        return 1;
    }

    return source_file_size / part_size + (source_file_size % part_size ? 1 : 0);
}

std::vector<std::filesystem::path> size_based_splitter::split(
    const std::filesystem::path& source_file_path,
    uint64_t source_file_size,
    uint64_t part_size,
    const part_namer& namer,
    progress_reporter& reporter,
    file_splitter::error_code& error_code,
    const cancellation_token* token)
{
    std::ifstream source_file{source_file_path, std::ios::binary};

    if (!source_file.is_open())
    {
        reporter.message(message_code::error_opening_file, source_file_path.string());
        error_code = file_splitter::error::source_open_failure;

        return std::vector<std::filesystem::path>{};
    }

    // Buffer never exceeds the part so a single chunk spans two parts at most
    size_t buffer_size = config::buffer_size;

    if (buffer_size > part_size)
    {
        buffer_size = static_cast<size_t>(part_size);
    }

    std::string buffer(buffer_size, char());

    part_descriptor part{
        namer.get_part_path(1, reporter, error_code), 
        1, 
        calculate_parts_number(source_file_size, part_size), 
        0};

    if (error_code)
    {
        return std::vector<std::filesystem::path>{};
    }

    part_writer writer{reporter, error_code};

    if (!writer.open(part.file_path))
    {
        return writer.release_part_paths();
    }

    uint64_t bytes_in_total = 0;

    // Read the file by chunks, never past the captured size, while there are read bytes
    while (bytes_in_total < source_file_size)
    {
        const uint64_t bytes_left = source_file_size - bytes_in_total;
        const size_t bytes_to_read = bytes_left < buffer_size ? static_cast<size_t>(bytes_left) : buffer_size;
        const auto bytes_in_buffer = static_cast<size_t>(source_file.read(buffer.data(), bytes_to_read).gcount());

        if (bytes_in_buffer == 0)
        {
            break;
        }

        if (token && token->is_cancelled())
        {
            writer.discard();

            return writer.release_part_paths();
        }

        // The entire chunk can be written into the current part
        if (part.written + bytes_in_buffer <= part_size)
        {
            if (!writer.write(buffer.data(), bytes_in_buffer))
            {
                return writer.release_part_paths();
            }

            part.written += bytes_in_buffer;
        }
        // Fill the current part up to the part size and carry the rest of the chunk into the next one
        else
        {
            // It is 0 if the previous chunk exactly completed the part
            const auto pending_to_write = static_cast<size_t>(part_size - part.written);

            if (pending_to_write > 0 && !writer.write(buffer.data(), pending_to_write))
            {
                return writer.release_part_paths();
            }

            if (!writer.close())
            {
                return writer.release_part_paths();
            }

            // Reads are limited by the captured size so the rest of the chunk always exists
            ++part.number;
            part.written = 0;
            part.file_path = namer.get_part_path(part.number, reporter, error_code);

            if (error_code || !writer.open(part.file_path))
            {
                return writer.release_part_paths();
            }

            if (!writer.write(buffer.data() + pending_to_write, bytes_in_buffer - pending_to_write))
            {
                return writer.release_part_paths();
            }

            part.written = bytes_in_buffer - pending_to_write;
        }

        bytes_in_total += bytes_in_buffer;

        reporter.progress(progress_event{part.file_path, part.number, part.written, part.total_parts, part_size});
    }

    if (source_file.bad())
    {
        reporter.message(message_code::error_opening_file, source_file_path.string());
        error_code = file_splitter::error::source_open_failure;

        return writer.release_part_paths();
    }

    // Close the last part if the loop didn't do it
    if (writer.is_open() && !writer.close())
    {
        return writer.release_part_paths();
    }

    if (bytes_in_total != source_file_size)
    {
        reporter.message(message_code::error_total_size_not_equals, bytes_in_total, source_file_size);
        error_code = file_splitter::error::size_mismatch;

        return writer.release_part_paths();
    }

    // The source grew after its size was captured, the rest of it is not in the parts
    if (source_file.peek() != std::ifstream::traits_type::eof())
    {
        std::error_code filesystem_error_code;
        const uint64_t current_file_size = std::filesystem::file_size(source_file_path, filesystem_error_code);

        if (filesystem_error_code)
        {
            LOG_ERROR << filesystem_error_code.message();
        }

        reporter.message(
            message_code::error_total_size_not_equals, 
            bytes_in_total, 
            filesystem_error_code ? source_file_size : current_file_size);
        error_code = file_splitter::error::size_mismatch;
    }

    return writer.release_part_paths();
}
