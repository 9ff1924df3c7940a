#include "block_index.hh"

#include <long-bytes/error.hh>

#include <string>

namespace
{
std::string range_string(lb::isize offset, lb::isize count)
{
    return "[" + std::to_string(offset) + ", " + std::to_string(offset) + " + " + std::to_string(count) + ")";
}
} // namespace

void lb::impl::check_index(isize index, isize length, lb::source_location site)
{
    if (index < 0 || index >= length)
        impl::throw_error(error_kind::out_of_range,
                          "index " + std::to_string(index) + " is out of bounds [0, " + std::to_string(length) + ")", site);
}

void lb::impl::check_sub_range(isize offset, isize count, isize length, lb::source_location site)
{
    if (offset < 0 || offset >= length)
        impl::throw_error(error_kind::out_of_range,
                          "offset " + std::to_string(offset) + " is out of bounds [0, " + std::to_string(length) + ")", site);

    if (count < 0)
        impl::throw_error(error_kind::invalid_argument, "requested sub-array length " + std::to_string(count) + " is negative", site);

    if (count > max_buffer_size)
        impl::throw_error(error_kind::too_large,
                          "sub-array of " + std::to_string(count) + " bytes exceeds the single buffer limit of "
                              + std::to_string(max_buffer_size),
                          site);

    // offset < length here, so the subtraction cannot overflow
    if (count > length - offset)
        impl::throw_error(error_kind::out_of_range,
                          "sub-array " + range_string(offset, count) + " exceeds the length " + std::to_string(length), site);
}

void lb::impl::check_write_range(isize offset, isize count, isize length, lb::source_location site)
{
    if (offset < 0 || offset > length || count > length - offset)
        impl::throw_error(error_kind::out_of_range,
                          "range " + range_string(offset, count) + " is out of bounds [0, " + std::to_string(length) + ")", site);
}

void lb::impl::check_single_buffer(isize length, lb::source_location site)
{
    if (length > max_buffer_size)
        impl::throw_error(error_kind::too_large,
                          "cannot materialize " + std::to_string(length) + " bytes into one buffer, the limit is "
                              + std::to_string(max_buffer_size),
                          site);
}
