#include <splitting/progress_reporter.hpp>

std::string split_message::text() const
{
    std::string result{magic_enum::enum_name(code)};

    if (parameters.empty())
    {
        return result;
    }

    result += " (";

    for (size_t i = 0; i < parameters.size(); ++i)
    {
        if (i)
        {
            result += ", ";
        }

        result += parameters[i];
    }

    result += ')';

    return result;
}

void progress_reporter::start()
{
    if (_is_started)
    {
        return;
    }

    _is_started = true;

    if (_observer.on_start)
    {
        _observer.on_start();
    }
}

void progress_reporter::progress(const progress_event& event)
{
    if (_observer.on_progress)
    {
        _observer.on_progress(event);
    }
}

void progress_reporter::deliver(const split_message& message)
{
    if (message.is_error())
    {
        LOG_ERROR << message.text();
    }
    else
    {
        LOG_INFO << message.text();
    }

    if (_observer.on_message)
    {
        _observer.on_message(message);
    }
}

void progress_reporter::finish()
{
    if (_is_finished)
    {
        return;
    }

    _is_finished = true;

    if (_observer.on_finish)
    {
        _observer.on_finish();
    }
}
