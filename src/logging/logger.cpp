#include <logging/logger.hpp>

//external
#include <boost/log/expressions/formatters/if.hpp>

logging::trivial::severity_level get_configured_severity()
{
    logging::trivial::severity_level severity = logging::trivial::debug;

    if (!logging::trivial::from_string(config::log_severity.data(), config::log_severity.size(), severity))
    {
        return logging::trivial::debug;
    }

    return severity;
}

BOOST_LOG_GLOBAL_LOGGER_INIT(_logger_mt, src::severity_logger_mt)
{
    logger_mt _logger_mt;
    logging::add_common_attributes();

    // Records made outside of any operation have no operation tag
    const auto _format = expr::stream 
        << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
        << "] <" << expr::attr<logging::trivial::severity_level>("Severity") << "> ["
        << expr::attr<std::string>("File") << ":" 
        << expr::attr<int>("Line") << "] ["
        << expr::attr<std::string>("Function") << "] "
        << expr::if_(expr::has_attr<std::string>("Operation"))
           [
               expr::stream << "[" << expr::attr<std::string>("Operation") << "] "
           ]
        << expr::smessage;

    logging::add_file_log(
        logging::keywords::file_name = config::log_file_path,
        logging::keywords::open_mode = std::ios::app,
        logging::keywords::auto_flush = true,
        logging::keywords::format = _format);
        
    if (config::console_log_enabled)
    {
        logging::add_console_log(
            std::clog,
            logging::keywords::format = _format);
    }

    const logging::trivial::severity_level threshold = get_configured_severity();

    logging::core::get()->set_filter
    (
        logging::trivial::severity >= threshold
    );
    return _logger_mt;
}
