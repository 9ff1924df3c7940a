#include "linked_byte_array.hh"

#include <long-bytes/block_index.hh>
#include <long-bytes/error.hh>

#include <string>

namespace
{
// staging size for write(), elements are still fetched one by one
constexpr lb::isize write_chunk_size = 4096;
} // namespace

lb::linked_byte_array::linked_byte_array(private_tag, array_ref base, isize offset, isize length)
  : _base(lb::move(base)), _offset(offset), _length(length)
{
}

std::shared_ptr<lb::linked_byte_array> lb::linked_byte_array::create(array_ref base, isize offset, isize length)
{
    if (!base.is_valid())
        impl::throw_error(error_kind::null_base, "cannot create a linked_byte_array without a base array");

    if (offset < 0)
        impl::throw_error(error_kind::out_of_range, "view offset " + std::to_string(offset) + " is negative");
    if (length < 0)
        impl::throw_error(error_kind::out_of_range, "view length " + std::to_string(length) + " is negative");

    auto const base_length = base.length();
    if (offset > base_length || length > base_length - offset)
        impl::throw_error(error_kind::out_of_range, "view [" + std::to_string(offset) + ", " + std::to_string(offset) + " + "
                                                        + std::to_string(length) + ") exceeds the base length "
                                                        + std::to_string(base_length));

    return std::make_shared<linked_byte_array>(private_tag{}, lb::move(base), offset, length);
}

lb::byte lb::linked_byte_array::get(isize index) const
{
    impl::check_index(index, _length);
    return _base.get(_offset + index);
}

void lb::linked_byte_array::put(isize index, byte value)
{
    impl::check_index(index, _length);
    _base.put(_offset + index, value);
}

void lb::linked_byte_array::put_range(isize offset, lb::span<byte const> data)
{
    impl::check_write_range(offset, data.size(), _length);
    _base.put_range(_offset + offset, data);
}

lb::unique_array<lb::byte> lb::linked_byte_array::get_sub_array(isize offset, isize count) const
{
    impl::check_sub_range(offset, count, _length);
    return _base.get_sub_array(_offset + offset, count);
}

lb::unique_array<lb::byte> lb::linked_byte_array::to_regular_array() const
{
    impl::check_single_buffer(_length);

    if (_length == 0)
        return {};

    return _base.get_sub_array(_offset, _length);
}

void lb::linked_byte_array::write(lb::byte_sink sink) const
{
    if (_length == 0)
        return;

    // the offset is not block aligned in general, so there is no per-block fast path here
    auto staging = lb::unique_array<byte>::create_uninitialized(lb::min(write_chunk_size, _length));
    isize filled = 0;
    isize flushed = 0;

    auto const flush = [&]
    {
        if (!sink(lb::span<byte const>(staging.data(), filled)))
            impl::throw_error(error_kind::io_failure, "sink rejected " + std::to_string(filled) + " bytes at offset "
                                                          + std::to_string(flushed) + " of " + std::to_string(_length));
        flushed += filled;
        filled = 0;
    };

    for (isize i = 0; i < _length; ++i)
    {
        staging[filled++] = get(i);
        if (filled == staging.size())
            flush();
    }

    if (filled > 0)
        flush();
}

std::string lb::linked_byte_array::to_string() const
{
    return "linked_byte_array[0," + std::to_string(_length - 1) + "] at offset " + std::to_string(_offset) + " -> " + _base.to_string();
}
