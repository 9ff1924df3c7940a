#include "long_byte_array.hh"

#include <long-bytes/block_index.hh>
#include <long-bytes/error.hh>
#include <long-bytes/function_ref.hh>

#include <string>

lb::long_byte_array::long_byte_array(private_tag, isize length, i32 block_size) : _length(length), _store(block_size) {}

std::shared_ptr<lb::long_byte_array> lb::long_byte_array::create(isize length, i32 block_size)
{
    if (length < 0)
        impl::throw_error(error_kind::invalid_argument, "array length " + std::to_string(length) + " is negative");
    if (block_size <= 0)
        impl::throw_error(error_kind::invalid_argument, "block size " + std::to_string(block_size) + " is not positive");

    return std::make_shared<long_byte_array>(private_tag{}, length, block_size);
}

std::shared_ptr<lb::long_byte_array> lb::long_byte_array::create_copy_of(lb::span<byte const> data)
{
    if (data.empty())
        return create(0);

    impl::check_single_buffer(data.size());

    auto arr = std::make_shared<long_byte_array>(private_tag{}, data.size(), i32(data.size()));
    arr->_store.adopt_block(0, lb::unique_array<byte>::create_copy_of(data));
    return arr;
}

lb::byte lb::long_byte_array::get(isize index) const
{
    impl::check_index(index, _length);
    return _store.load(index);
}

void lb::long_byte_array::put(isize index, byte value)
{
    impl::check_index(index, _length);
    _store.store(index, value);
}

void lb::long_byte_array::put_range(isize offset, lb::span<byte const> data)
{
    impl::check_write_range(offset, data.size(), _length);
    _store.store_range(offset, data);
}

lb::unique_array<lb::byte> lb::long_byte_array::get_sub_array(isize offset, isize count) const
{
    impl::check_sub_range(offset, count, _length);

    auto result = lb::unique_array<byte>::create_uninitialized(count);
    _store.load_range(offset, lb::span<byte>(result));
    return result;
}

lb::unique_array<lb::byte> lb::long_byte_array::to_regular_array() const
{
    impl::check_single_buffer(_length);

    if (_length == 0)
        return {};

    return get_sub_array(0, _length);
}

void lb::long_byte_array::write(lb::byte_sink sink) const
{
    if (_length == 0)
        return;

    auto const block_size = _store.block_size();
    auto const last_block = max_block_index();

    // one block at a time: the lock is released while the sink runs
    auto staging = lb::unique_array<byte>::create_uninitialized(block_size);
    for (isize b = 0; b <= last_block; ++b)
    {
        auto const start = lb::block_start(b, block_size);
        auto const chunk = lb::span<byte>(staging).first(lb::min(isize(block_size), _length - start));

        _store.load_block(b, chunk);

        if (!sink(chunk))
            impl::throw_error(error_kind::io_failure, "sink rejected " + std::to_string(chunk.size()) + " bytes at offset "
                                                          + std::to_string(start) + " of " + std::to_string(_length));
    }
}

lb::f64 lb::long_byte_array::fill_factor() const
{
    if (_length == 0)
        return 1.0;

    return f64(_store.block_count()) / f64(lb::max_block_count(_length, _store.block_size()));
}

lb::isize lb::long_byte_array::max_block_index() const
{
    return lb::max_block_index(_length, _store.block_size());
}

lb::isize lb::long_byte_array::block_index(isize index) const
{
    impl::check_index(index, _length);
    return lb::block_index(index, _store.block_size());
}

lb::i32 lb::long_byte_array::index_in_block(isize index) const
{
    impl::check_index(index, _length);
    return lb::index_in_block(index, _store.block_size());
}

bool lb::long_byte_array::is_materialized(isize index) const
{
    return _store.is_materialized(block_index(index));
}

std::string lb::long_byte_array::to_string() const
{
    return "long_byte_array[0," + std::to_string(_length - 1) + "]";
}
