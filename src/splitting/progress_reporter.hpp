#ifndef PROGRESS_REPORTER_HPP
#define PROGRESS_REPORTER_HPP

//local
#include <logging/logger.hpp>
#include <splitting/split_job.hpp>

//internal
#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

//external
#include <magic_enum.hpp>

// Codes of the messages that are reported to the user during the operation
// The enumerator name is the code that is shown to the user, codes starting with error_ precede a failure
enum class message_code
{
    // Parameters: minimum part size in bytes
    error_minimum_part_size,
    // Parameters: file path
    error_opening_file,
    // Parameters: file or folder path
    error_creating_file,
    // Parameters: available space in bytes, source file size in bytes
    error_no_space_to_split,
    // Parameters: filesystem format, maximum amount, unit label
    error_filesystem_not_allow_size,
    // Parameters: written bytes, source file size in bytes
    error_total_size_not_equals,
    // Parameters: file name pattern
    error_invalid_name_pattern,
    // Parameters: generation log path
    error_writing_generation_log,
    // Parameters: source file path
    error_deleting_source_file,
    // Parameters: path of the discarded part
    info_operation_cancelled,
    // Parameters: source file path
    info_source_file_deleted
};

struct split_message
{
    message_code code;
    std::vector<std::string> parameters;

    bool is_error() const
    {
        return magic_enum::enum_name(code).starts_with("error_");
    }

    // Human-readable representation e.g. "error_filesystem_not_allow_size (FAT32, 4, Gb)"
    std::string text() const;
};

// Set of callbacks that are invoked synchronously while the operation is in progress
// Any of them can be left empty
struct split_observer
{
    std::function<void()> on_start{};
    std::function<void(const progress_event&)> on_progress{};
    std::function<void(const split_message&)> on_message{};
    std::function<void()> on_finish{};
};

// Deliver notifications of a single operation to the observer and mirror them to the log
// Start and finish are delivered at most once each
class progress_reporter
{
    public:
        progress_reporter(){}

        explicit progress_reporter(split_observer observer)
            : _observer{std::move(observer)}{}

        void start();

        void progress(const progress_event& event);

        // Report the message with given code, converting each parameter to string with std::format
        template <typename... parameters_t>
        void message(message_code code, const parameters_t&... parameters)
        {
            split_message message{code, {}};
            message.parameters.reserve(sizeof...(parameters));
            (message.parameters.emplace_back(std::format("{}", parameters)), ...);

            deliver(message);
        }

        void finish();

        bool is_finished() const
        {
            return _is_finished;
        }

    private:
        void deliver(const split_message& message);

        split_observer _observer;
        bool _is_started{false};
        bool _is_finished{false};
};

#endif
