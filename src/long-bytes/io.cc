#include "io.hh"

#include <long-bytes/block_index.hh>
#include <long-bytes/error.hh>
#include <long-bytes/long_byte_array.hh>
#include <long-bytes/unique_array.hh>
#include <long-bytes/utility.hh>

#include <cstdio>
#include <string>

std::shared_ptr<lb::long_byte_array> lb::read_array(lb::byte_source source, isize length, i32 block_size)
{
    auto arr = long_byte_array::create(length, block_size);

    auto staging = lb::unique_array<byte>::create_uninitialized(lb::min(isize(block_size), length));
    isize pos = 0;
    while (pos < length)
    {
        // never cross a block boundary so each put_range touches one block
        auto const wanted = lb::min(isize(block_size - lb::index_in_block(pos, block_size)), length - pos);
        auto const target = lb::span<byte>(staging).first(wanted);

        auto const got = source(target);
        if (got < 0)
            impl::throw_error(error_kind::io_failure, "byte source failed at position " + std::to_string(pos) + " of " + std::to_string(length));
        if (got == 0)
            impl::throw_error(error_kind::truncated_source, "byte source ended at position " + std::to_string(pos)
                                                                + " before the declared length " + std::to_string(length));
        if (got > wanted)
            impl::throw_error(error_kind::io_failure, "byte source delivered " + std::to_string(got) + " bytes, only "
                                                          + std::to_string(wanted) + " were requested");

        arr->put_range(pos, target.first(got));
        pos += got;
    }

    return arr;
}

void lb::write_file(array_ref const& array, char const* path)
{
    auto* f = std::fopen(path, "wb");
    if (f == nullptr)
        impl::throw_error(error_kind::io_failure, "cannot open '" + std::string(path) + "' for writing");

    try
    {
        array.write([&](lb::span<byte const> chunk) { return std::fwrite(chunk.data(), 1, size_t(chunk.size()), f) == size_t(chunk.size()); });
    }
    catch (...)
    {
        std::fclose(f);
        throw;
    }

    // fclose flushes, a failure here means data was lost
    if (std::fclose(f) != 0)
        impl::throw_error(error_kind::io_failure, "cannot finish writing '" + std::string(path) + "'");
}

std::shared_ptr<lb::long_byte_array> lb::read_file(char const* path, isize length, i32 block_size)
{
    auto* f = std::fopen(path, "rb");
    if (f == nullptr)
        impl::throw_error(error_kind::io_failure, "cannot open '" + std::string(path) + "' for reading");
    LB_DEFER { std::fclose(f); };

    return lb::read_array(
        [&](lb::span<byte> buffer) -> isize
        {
            auto const n = std::fread(buffer.data(), 1, size_t(buffer.size()), f);
            if (n == 0 && std::ferror(f))
                return -1;
            return isize(n);
        },
        length, block_size);
}
