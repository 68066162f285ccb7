#ifndef SPLIT_JOB_RUNNER_HPP
#define SPLIT_JOB_RUNNER_HPP

//local
#include <splitting/cancellation_token.hpp>
#include <splitting/capacity_guard.hpp>
#include <splitting/line_based_splitter.hpp>
#include <splitting/part_namer.hpp>
#include <splitting/progress_reporter.hpp>
#include <splitting/size_based_splitter.hpp>
#include <splitting/split_job.hpp>
#include <file_splitter/error.hpp>

//internal
#include <filesystem>
#include <functional>
#include <optional>
#include <system_error>
#include <vector>

// Drive the split job through its states:
// not_started -> validating -> splitting -> finalizing -> succeeded | failed
class split_job_runner
{
    public:
        // Source of the destination drive state, it is replaceable to run the job against a simulated drive
        using drive_info_provider = std::function<drive_info(const std::filesystem::path&, std::error_code&)>;

        explicit split_job_runner(
            split_job job, 
            split_observer observer = split_observer{},
            drive_info_provider provider = &capacity_guard::query_drive_info)
            : _job{std::move(job)},
              _observer{std::move(observer)},
              _drive_info_provider{std::move(provider)}{}

        /**
         * @brief Validate the job, split the source file and delete it afterwards if it is requested.
         * Start notification is delivered before the validation and finish notification is delivered
         * exactly once whatever the outcome is, even if an exception leaves the function.
         * The runner can be run only once, the second call throws std::logic_error.
         *
         * @param error_code operation status in terms of file_splitter::error codes.
         * Validation failures are set before any output file is created.
         * @param token optional token to interrupt the splitting.
         *
         * @return Paths of the produced parts. On failure it contains the parts written before the failure.
         */
        std::vector<std::filesystem::path> run(
            file_splitter::error_code& error_code, 
            const cancellation_token* token = nullptr);

        split_state get_state() const
        {
            return _state;
        }

        const split_job& get_job() const
        {
            return _job;
        }

    private:
        // Check the source file and the destination drive, prepare the namer and create the destination folder
        std::optional<part_namer> validate(
            progress_reporter& reporter, 
            file_splitter::error_code& error_code,
            uint64_t& source_file_size);

        // Delete the source file if it is requested and it is not read-only
        bool finalize(progress_reporter& reporter, file_splitter::error_code& error_code);

        void set_state(split_state state);

        split_job _job;
        split_observer _observer;
        drive_info_provider _drive_info_provider;
        split_state _state{split_state::not_started};
};

#endif
