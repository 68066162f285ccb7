#include <cli/command_line.hpp>

//local
#include <config.hpp>
#include <logging/logger.hpp>
#include <joining/part_joiner.hpp>
#include <splitting/cancellation_token.hpp>
#include <splitting/split_job_runner.hpp>
#include <splitting/split_unit.hpp>

//internal
#include <csignal>
#include <iostream>
#include <stdexcept>

//external
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace
{
    // Interrupted by SIGINT or SIGTERM, the current part is discarded
    cancellation_token interruption_token;

    void handle_interruption_signal(int)
    {
        interruption_token.cancel();
    }

    // Render notifications of the operation on the console
    split_observer make_console_observer()
    {
        split_observer observer;

        observer.on_progress = 
            [](const progress_event& event)
            {
                std::cout << '\r' << event.file_path.filename().string() << " [" << event.part_number;

                if (event.total_parts)
                {
                    std::cout << '/' << event.total_parts;
                }

                std::cout << "] " << event.written_in_part << '/' << event.part_size << std::flush;
            };

        observer.on_message = 
            [](const split_message& message)
            {
                (message.is_error() ? std::cerr : std::cout) << '\n' << message.text() << std::endl;
            };

        observer.on_finish = 
            []
            {
                std::cout << std::endl;
            };

        return observer;
    }

    int run_split(const std::vector<std::string>& arguments)
    {
        split_job job = cli::parse_split_arguments(arguments);

        LOG_OPERATION("split " + job.source_file_path.filename().string());

        file_splitter::error_code error_code;
        split_job_runner runner{std::move(job), make_console_observer()};

        std::vector<std::filesystem::path> part_paths = runner.run(error_code, &interruption_token);

        if (error_code)
        {
            std::cerr << "Split failed: " << error_code.message() << std::endl;

            return cli::OPERATION_FAILED;
        }

        std::cout << "Created " << part_paths.size() << " parts" << std::endl;

        return cli::SUCCESS;
    }

    int run_join(const std::vector<std::string>& arguments)
    {
        cli::join_request request = cli::parse_join_arguments(arguments);

        LOG_OPERATION("join " + request.output_file_path.filename().string());

        file_splitter::error_code error_code;

        if (request.generation_log_file_path.has_value())
        {
            request.part_paths = part_joiner::read_generation_log(
                request.generation_log_file_path.value(),
                request.parts_folder.value_or(request.generation_log_file_path->parent_path()),
                error_code);

            if (error_code)
            {
                std::cerr << "Join failed: " << error_code.message() << std::endl;

                return cli::OPERATION_FAILED;
            }
        }

        uint64_t written_bytes = part_joiner::join(
            request.part_paths, 
            request.output_file_path, 
            make_console_observer(), 
            error_code, 
            &interruption_token);

        if (error_code)
        {
            std::cerr << "Join failed: " << error_code.message() << std::endl;

            return cli::OPERATION_FAILED;
        }

        std::cout << "Written " << written_bytes << " bytes to " << request.output_file_path.string() << std::endl;

        return cli::SUCCESS;
    }
}

split_job cli::parse_split_arguments(const std::vector<std::string>& arguments)
{
    std::string source, unit_name{"Bytes"}, destination, pattern, generation_log;
    uint64_t size = 0;

    po::options_description options{"Split options"};
    options.add_options()
        ("source", po::value(&source)->required(), "file to split")
        ("size,s", po::value(&size)->required(), "part size in units")
        ("unit,u", po::value(&unit_name), "Bytes, KiloBytes, MegaBytes, GigaBytes or Lines (Bytes by default)")
        ("destination,d", po::value(&destination), "folder for the parts (source folder by default)")
        ("pattern,p", po::value(&pattern), "part name pattern, {0} - part number, {1} - total parts")
        ("log,l", po::value(&generation_log), "file to append generated part names to")
        ("delete-original", "delete the source file after successful split");

    po::positional_options_description positional;
    positional.add("source", 1);

    po::variables_map variables;
    po::store(po::command_line_parser(arguments).options(options).positional(positional).run(), variables);
    po::notify(variables);

    std::optional<split_unit> unit = parse_split_unit(unit_name);

    if (!unit.has_value())
    {
        throw std::invalid_argument{"Unknown unit: " + unit_name};
    }

    const uint64_t factor = get_split_unit_factor(unit.value());

    if (size == 0 || size > UINT64_MAX / factor)
    {
        throw std::invalid_argument{"Invalid part size: " + std::to_string(size)};
    }

    split_job job;
    job.source_file_path = source;
    job.part_size = size * factor;
    job.mode = unit.value() == split_unit::Lines ? operation_mode::by_lines : operation_mode::by_bytes;
    job.delete_original_file = variables.count("delete-original") > 0;

    if (!destination.empty())
    {
        job.destination_folder = destination;
    }
    if (!pattern.empty())
    {
        job.file_name_pattern = pattern;
    }
    if (!generation_log.empty())
    {
        job.generation_log_file_path = generation_log;
    }

    return job;
}

cli::join_request cli::parse_join_arguments(const std::vector<std::string>& arguments)
{
    std::string output, generation_log, folder;
    std::vector<std::string> parts;

    po::options_description options{"Join options"};
    options.add_options()
        ("output,o", po::value(&output)->required(), "file to write the joined parts to")
        ("parts", po::value(&parts), "part files in order")
        ("from-log", po::value(&generation_log), "generation log listing the parts in order")
        ("folder", po::value(&folder), "folder to resolve names from the generation log against");

    po::positional_options_description positional;
    positional.add("parts", -1);

    po::variables_map variables;
    po::store(po::command_line_parser(arguments).options(options).positional(positional).run(), variables);
    po::notify(variables);

    if (parts.empty() == generation_log.empty())
    {
        throw std::invalid_argument{"Either part files or --from-log has to be provided"};
    }

    join_request request;
    request.output_file_path = output;
    request.part_paths.assign(parts.begin(), parts.end());

    if (!generation_log.empty())
    {
        request.generation_log_file_path = generation_log;
    }
    if (!folder.empty())
    {
        request.parts_folder = folder;
    }

    return request;
}

int cli::run(int argc, char* argv[])
{
    std::string command, config_path;

    po::options_description global_options{"Usage: file_splitter [--config <path>] <split|join> [options]"};
    global_options.add_options()
        ("help,h", "show help")
        ("config", po::value(&config_path), "json config path")
        ("command", po::value(&command), "split or join")
        ("arguments", po::value<std::vector<std::string>>(), "command arguments");

    po::positional_options_description positional;
    positional.add("command", 1).add("arguments", -1);

    try
    {
        po::parsed_options parsed = po::command_line_parser(argc, argv)
            .options(global_options)
            .positional(positional)
            .allow_unregistered()
            .run();

        po::variables_map variables;
        po::store(parsed, variables);
        po::notify(variables);

        if (variables.count("help") || command.empty())
        {
            std::cout << global_options << std::endl;

            return command.empty() && !variables.count("help") ? USAGE_ERROR : SUCCESS;
        }

        // Initialize config variables from the config file if there is one
        if (!config_path.empty())
        {
            config::init(config_path);
        }
        else if (std::filesystem::exists(config::config_path))
        {
            config::init();
        }

        // Everything after the command name belongs to the command itself
        std::vector<std::string> arguments = po::collect_unrecognized(parsed.options, po::include_positional);
        arguments.erase(arguments.begin());

        std::signal(SIGINT, handle_interruption_signal);
        std::signal(SIGTERM, handle_interruption_signal);

        if (command == "split")
        {
            return run_split(arguments);
        }
        else if (command == "join")
        {
            return run_join(arguments);
        }

        std::cerr << "Unknown command: " << command << std::endl;

        return USAGE_ERROR;
    }
    catch (const po::error& ex)
    {
        std::cerr << ex.what() << std::endl;

        return USAGE_ERROR;
    }
    catch (const std::invalid_argument& ex)
    {
        std::cerr << ex.what() << std::endl;

        return USAGE_ERROR;
    }
    catch (const std::exception& ex)
    {
        LOG_ERROR << ex.what();
        std::cerr << ex.what() << std::endl;

        return OPERATION_FAILED;
    }
}
