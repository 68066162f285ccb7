#ifndef PRECOMPILED_HEADERS_HPP
#define PRECOMPILED_HEADERS_HPP

#include <atomic>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <stdint.h>
#include <vector>
#include <map>
#include <filesystem>
#include <format>
#include <system_error>

#include <unicode/ucnv.h>
#include <magic_enum.hpp>
#include <boost/json.hpp>
#include <boost/system/error_code.hpp>
#include <boost/scope_exit.hpp>
#include <boost/program_options.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <config.hpp>
#include <logging/logger.hpp>
#include <file_splitter/error.hpp>
#include <splitting/split_job.hpp>
#include <splitting/progress_reporter.hpp>

#endif
