#include "array_reader.hh"

#include <long-bytes/error.hh>

#include <cstring>
#include <string>

lb::array_reader::array_reader(array_ref source) : _source(lb::move(source))
{
    if (!_source.is_valid())
        impl::throw_error(error_kind::null_base, "cannot read from an empty array_ref");
}

std::optional<lb::byte> lb::array_reader::read()
{
    if (_position >= _source.length())
        return std::nullopt;

    return _source.get(_position++);
}

lb::isize lb::array_reader::read(lb::span<byte> dst)
{
    auto const count = lb::min(lb::min(dst.size(), available()), max_buffer_size);
    if (count <= 0)
        return 0;

    auto const bytes = _source.get_sub_array(_position, count);
    std::memcpy(dst.data(), bytes.data(), size_t(count));
    _position += count;
    return count;
}

lb::isize lb::array_reader::skip(isize count)
{
    if (count < 0)
        impl::throw_error(error_kind::invalid_argument, "cannot skip a negative number of bytes (" + std::to_string(count) + ")");

    auto const skipped = lb::min(count, available());
    _position += skipped;
    return skipped;
}
