#ifndef LOGGER_HPP
#define LOGGER_HPP

//local
#include <config.hpp>

//internal
#include <string>

//external
#include <boost/filesystem/path.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

namespace src = boost::log::sources;
namespace expr = boost::log::expressions;
namespace logging = boost::log;

// Sinks are set up on the first use of the logger, so config::init() has to be invoked before it
// to direct the records to the configured log file with the configured severity threshold
#define LOG(LEVEL) BOOST_LOG_SEV(_logger_mt::get(), LEVEL)  \
    << logging::add_value("Line", __LINE__)  \
    << logging::add_value("File", boost::filesystem::path(__FILE__).filename().string())  \
    << logging::add_value("Function", __FUNCTION__)

#define LOG_ERROR LOG(logging::trivial::error)
#define LOG_WARNING LOG(logging::trivial::warning)
#define LOG_DEBUG LOG(logging::trivial::debug)
#define LOG_INFO LOG(logging::trivial::info)

// Tag every record of the current thread with the operation until the end of the enclosing scope
// e.g. LOG_OPERATION("split data.bin") gives "... [split data.bin] message"
#define LOG_OPERATION(DESCRIPTION) BOOST_LOG_SCOPED_THREAD_TAG("Operation", std::string(DESCRIPTION))

typedef src::severity_logger_mt<logging::trivial::severity_level> logger_mt;
BOOST_LOG_GLOBAL_LOGGER(_logger_mt, logger_mt)

// Severity named in config::log_severity, debug if the name is unknown
logging::trivial::severity_level get_configured_severity();

#endif
