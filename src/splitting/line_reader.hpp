#ifndef LINE_READER_HPP
#define LINE_READER_HPP

//local
#include <config.hpp>

//internal
#include <filesystem>
#include <fstream>
#include <string>
#include <stdint.h>

// Read a text file line by line keeping every byte of it, including terminators
// The encoding signature (byte order mark) is detected on opening and is not a part of the first line
// Terminators are \n, \r\n and \r, they are recognized in code units of the detected encoding
// so UTF-16 and UTF-32 files are split correctly too
class line_reader
{
    public:
        explicit line_reader(
            const std::filesystem::path& file_path, 
            size_t buffer_size = config::buffer_size);

        bool is_open() const
        {
            return _file.is_open();
        }

        // Read the next line with its terminator into line
        // The last line can be without terminator
        // Return false if there are no lines left
        bool read_line(std::string& line);

        // Return true if reading failed because of an I/O error rather than the end of file
        bool has_failed() const
        {
            return _has_failed;
        }

        // Bytes of the byte order mark the file starts with, empty if there are no one
        const std::string& get_signature() const
        {
            return _signature;
        }

        // Name of the encoding determined by the signature e.g. "UTF-16LE", empty if there is no signature
        const std::string& get_charset_name() const
        {
            return _charset_name;
        }

        size_t get_code_unit_size() const
        {
            return _code_unit_size;
        }

    private:
        void detect_signature();

        // Drop processed bytes and read the next chunk of the file into the buffer
        // Return false if nothing was read
        bool fill_buffer();

        uint32_t get_code_unit(size_t position) const;

        // Move buffer bytes from the current position up to end_position into the line
        void consume(std::string& line, size_t end_position);

        std::ifstream _file;
        std::string _buffer;
        size_t _position{0};
        size_t _buffer_size;
        std::string _signature;
        std::string _charset_name;
        size_t _code_unit_size{1};
        bool _is_big_endian{false};
        bool _has_failed{false};
};

#endif
