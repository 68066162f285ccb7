#ifndef FILE_SPLITTER_ERROR_HPP
#define FILE_SPLITTER_ERROR_HPP

#include <string>
#include <type_traits>

#include <boost/system/error_code.hpp>

namespace file_splitter
{
    using error_code = boost::system::error_code;
    using error_category = boost::system::error_category;
    using error_condition = boost::system::error_condition;

    // Error codes for splitting and joining operations.
    // Every one of them is fatal to the current job and is never retried.
    enum class error
    {
        // There is not enough free space on the destination drive to hold a copy of the source file.
        insufficient_space = 1,
        // The destination filesystem doesn't allow files as large as the requested part size.
        unsupported_part_size,
        // The requested part size is below the minimum allowed one.
        part_size_too_small,
        // The source file (or one of the parts to join) doesn't exist or can't be opened for reading.
        source_open_failure,
        // The destination folder or one of the output files can't be created.
        destination_create_failure,
        // The number of copied bytes doesn't match the size of the source file.
        size_mismatch,
        // The file name pattern can't be formatted with the part number and the total parts.
        invalid_name_pattern,
        // The generated file name can't be appended to the generation log.
        generation_log_failure,
        // The operation was interrupted through the cancellation token.
        operation_cancelled,
        // The source file was split successfully but couldn't be deleted afterwards.
        source_delete_failure
    };
}

// Enable present error codes to be used as boost errors.
namespace boost
{
    namespace system
    {
        template<>
        struct is_error_code_enum<file_splitter::error>
        {
            static bool const value = true;
        };
    }
}

namespace file_splitter
{
    namespace detail
    {
        class error_codes : public error_category
        {
            public:
                // Assign category id with random 64 bit value to avoid collisions and provide valid comparison.
                error_codes()
                : error_category(0x5d1f3a9e07c2b461u)
                {}

                const char* name() const noexcept override
                {
                    return "file_splitter";
                }

                std::string message(int ev) const override
                {
                    switch(static_cast<error>(ev))
                    {
                        case error::insufficient_space:
                        {
                            return "Not enough free space on the destination drive";
                        }
                        case error::unsupported_part_size:
                        {
                            return "Part size is not allowed by the destination filesystem";
                        }
                        case error::part_size_too_small:
                        {
                            return "Part size is less than the minimum allowed one";
                        }
                        case error::source_open_failure:
                        {
                            return "Source file can't be opened";
                        }
                        case error::destination_create_failure:
                        {
                            return "Destination file or folder can't be created";
                        }
                        case error::size_mismatch:
                        {
                            return "Total size of written parts doesn't match the source file size";
                        }
                        case error::invalid_name_pattern:
                        {
                            return "Invalid file name pattern";
                        }
                        case error::generation_log_failure:
                        {
                            return "Generated file name can't be written to the generation log";
                        }
                        case error::operation_cancelled:
                        {
                            return "Operation was cancelled";
                        }
                        case error::source_delete_failure:
                        {
                            return "Source file can't be deleted";
                        }
                        default:
                        {
                            return "Unknown error";
                        }
                    }
                }
        };
    }

    inline error_code make_error_code(error e)
    {
        static detail::error_codes const cat{};

        return error_code{static_cast<
            std::underlying_type<error>::type>(e), cat};
    }
}

#endif
