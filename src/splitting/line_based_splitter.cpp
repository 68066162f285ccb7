#include <splitting/line_based_splitter.hpp>

std::vector<std::filesystem::path> line_based_splitter::split(
    const std::filesystem::path& source_file_path,
    uint64_t part_size,
    const part_namer& namer,
    progress_reporter& reporter,
    file_splitter::error_code& error_code,
    const cancellation_token* token)
{
    line_reader reader{source_file_path};

    if (!reader.is_open() || reader.has_failed())
    {
        reporter.message(message_code::error_opening_file, source_file_path.string());
        error_code = file_splitter::error::source_open_failure;

        return std::vector<std::filesystem::path>{};
    }

    if (!reader.get_charset_name().empty())
    {
        LOG_DEBUG << "Detected " << reader.get_charset_name() << " signature in " << source_file_path.string();
    }

    part_writer writer{reporter, error_code};
    part_descriptor part{{}, 1, 0, 0};

    // The first part is created even if there are no lines at all
    if (!open_part(part, reader.get_signature(), namer, writer, reporter, error_code))
    {
        return writer.release_part_paths();
    }

    std::string line;

    while (reader.read_line(line))
    {
        if (token && token->is_cancelled())
        {
            writer.discard();

            return writer.release_part_paths();
        }

        // The next part is opened only when there is a line to write into it
        // so the file that ends right after the full part doesn't produce an empty trailing part
        if (!writer.is_open())
        {
            ++part.number;

            if (!open_part(part, reader.get_signature(), namer, writer, reporter, error_code))
            {
                return writer.release_part_paths();
            }
        }

        if (!writer.write(line))
        {
            return writer.release_part_paths();
        }

        ++part.written;

        if (part.written >= part_size && !writer.close())
        {
            return writer.release_part_paths();
        }

        reporter.progress(progress_event{part.file_path, part.number, part.written, 0, part_size});
    }

    if (reader.has_failed())
    {
        reporter.message(message_code::error_opening_file, source_file_path.string());
        error_code = file_splitter::error::source_open_failure;

        return writer.release_part_paths();
    }

    // On failure error_code is already set by the writer
    if (writer.is_open() && !writer.close())
    {
        LOG_ERROR << "The last part of " << source_file_path.string() << " can't be completed";
    }

    return writer.release_part_paths();
}

bool line_based_splitter::open_part(
    part_descriptor& part,
    const std::string& signature,
    const part_namer& namer,
    part_writer& writer,
    progress_reporter& reporter,
    file_splitter::error_code& error_code)
{
    part.written = 0;
    part.file_path = namer.get_part_path(part.number, reporter, error_code);

    if (error_code || !writer.open(part.file_path))
    {
        return false;
    }

    return signature.empty() || writer.write(signature);
}
