#include <splitting/line_reader.hpp>

//external
#include <unicode/ucnv.h>

line_reader::line_reader(const std::filesystem::path& file_path, size_t buffer_size)
    : _file{file_path, std::ios::binary},
      _buffer_size{buffer_size ? buffer_size : config::buffer_unit_size}
{
    if (_file.is_open())
    {
        detect_signature();
    }
}

void line_reader::detect_signature()
{
    // The longest signature among Unicode encodings is 4 bytes
    char head[4];
    _file.read(head, sizeof(head));
    const auto head_size = static_cast<int32_t>(_file.gcount());

    if (_file.bad())
    {
        _has_failed = true;

        return;
    }

    int32_t signature_length = 0;
    UErrorCode status = U_ZERO_ERROR;
    const char* charset_name = ucnv_detectUnicodeSignature(head, head_size, &signature_length, &status);

    if (U_SUCCESS(status) && charset_name != nullptr)
    {
        _charset_name = charset_name;
        _signature.assign(head, signature_length);

        if (_charset_name.starts_with("UTF-16"))
        {
            _code_unit_size = 2;
        }
        else if (_charset_name.starts_with("UTF-32"))
        {
            _code_unit_size = 4;
        }

        _is_big_endian = _charset_name.ends_with("BE");
    }

    // Bytes after the signature are the beginning of the first line
    _buffer.assign(head + signature_length, head_size - signature_length);
}

bool line_reader::read_line(std::string& line)
{
    line.clear();

    bool after_carriage_return = false;

    while (true)
    {
        size_t scan_position = _position;

        // Process only whole code units, the rest of them will be completed by the next buffer filling
        while (_buffer.size() - scan_position >= _code_unit_size)
        {
            const uint32_t code_unit = get_code_unit(scan_position);

            if (after_carriage_return)
            {
                // \r\n is a single terminator
                if (code_unit == '\n')
                {
                    scan_position += _code_unit_size;
                }

                consume(line, scan_position);

                return true;
            }

            scan_position += _code_unit_size;

            if (code_unit == '\n')
            {
                consume(line, scan_position);

                return true;
            }

            if (code_unit == '\r')
            {
                after_carriage_return = true;
            }
        }

        consume(line, scan_position);

        if (!fill_buffer())
        {
            // Trailing bytes that don't form a whole code unit still belong to the last line
            consume(line, _buffer.size());

            return !line.empty();
        }
    }
}

bool line_reader::fill_buffer()
{
    if (_has_failed || !_file.is_open())
    {
        return false;
    }

    _buffer.erase(0, _position);
    _position = 0;

    const size_t previous_size = _buffer.size();
    _buffer.resize(previous_size + _buffer_size);

    _file.read(_buffer.data() + previous_size, _buffer_size);
    const auto read_bytes = static_cast<size_t>(_file.gcount());

    _buffer.resize(previous_size + read_bytes);

    if (_file.bad())
    {
        _has_failed = true;

        return false;
    }

    return read_bytes > 0;
}

uint32_t line_reader::get_code_unit(size_t position) const
{
    uint32_t code_unit = 0;

    for (size_t i = 0; i < _code_unit_size; ++i)
    {
        const auto byte = static_cast<unsigned char>(
            _buffer[_is_big_endian ? position + i : position + _code_unit_size - 1 - i]);

        code_unit = (code_unit << 8) | byte;
    }

    return code_unit;
}

void line_reader::consume(std::string& line, size_t end_position)
{
    line.append(_buffer, _position, end_position - _position);
    _position = end_position;
}
