#include "error.hh"

#include <string>

std::string_view lb::to_string(error_kind kind)
{
    switch (kind)
    {
    case error_kind::null_base:
        return "null_base";
    case error_kind::out_of_range:
        return "out_of_range";
    case error_kind::invalid_argument:
        return "invalid_argument";
    case error_kind::too_large:
        return "too_large";
    case error_kind::truncated_source:
        return "truncated_source";
    case error_kind::io_failure:
        return "io_failure";
    }
    return "<unknown error_kind>";
}

lb::array_error::array_error(error_kind kind, std::string message, lb::source_location site)
  : _kind(kind), _message(std::move(message)), _site(site)
{
}

std::string lb::array_error::to_string() const
{
    std::string result;

    result += "error (";
    result += lb::to_string(_kind);
    result += "): ";
    result += _message;
    result += "\n";

    result += "  at ";
    result += _site.file_name();
    result += ":";
    result += std::to_string(_site.line());
    result += " - ";
    result += _site.function_name();
    result += "\n";

    return result;
}

[[noreturn]] LB_COLD_FUNC void lb::impl::throw_error(error_kind kind, std::string message, lb::source_location site)
{
    throw array_error(kind, std::move(message), site);
}
