#include "block_store.hh"

#include <long-bytes/block_index.hh>

#include <cstring>

namespace
{
// returns the block, creating a zero-filled one if it does not exist yet
// must be called with the table locked
lb::block_store::block& materialize(lb::block_store::block_table& table, lb::isize block_idx, lb::i32 block_size)
{
    auto it = table.find(block_idx);
    if (it == table.end())
        it = table.emplace(block_idx, lb::block_store::block::create_defaulted(block_size)).first;

    LB_ASSERT(it->second.size() == block_size, "materialized blocks always span the full block size");
    return it->second;
}
} // namespace

lb::block_store::block_store(i32 block_size) : _block_size(block_size)
{
    LB_ASSERT(block_size > 0, "block size must be positive");
}

lb::byte lb::block_store::load(isize pos) const
{
    auto const b = lb::block_index(pos, _block_size);
    auto const i = lb::index_in_block(pos, _block_size);

    return _blocks.lock(
        [&](block_table const& table) -> byte
        {
            auto const it = table.find(b);
            return it == table.end() ? byte(0) : it->second[i];
        });
}

void lb::block_store::store(isize pos, byte value)
{
    auto const b = lb::block_index(pos, _block_size);
    auto const i = lb::index_in_block(pos, _block_size);

    _blocks.lock([&](block_table& table) { materialize(table, b, _block_size)[i] = value; });
}

void lb::block_store::load_range(isize pos, lb::span<byte> dst) const
{
    if (dst.empty())
        return;

    _blocks.lock(
        [&](block_table const& table)
        {
            auto b = lb::block_index(pos, _block_size);
            isize in_block = lb::index_in_block(pos, _block_size);
            isize written = 0;

            while (written < dst.size())
            {
                auto const n = lb::min(isize(_block_size) - in_block, dst.size() - written);
                auto* out = dst.data() + written;

                auto const it = table.find(b);
                if (it == table.end())
                    std::memset(out, 0, size_t(n));
                else
                    std::memcpy(out, it->second.data() + in_block, size_t(n));

                written += n;
                in_block = 0;
                ++b;
            }
        });
}

void lb::block_store::store_range(isize pos, lb::span<byte const> src)
{
    if (src.empty())
        return;

    _blocks.lock(
        [&](block_table& table)
        {
            auto b = lb::block_index(pos, _block_size);
            isize in_block = lb::index_in_block(pos, _block_size);
            isize read = 0;

            while (read < src.size())
            {
                auto const n = lb::min(isize(_block_size) - in_block, src.size() - read);
                std::memcpy(materialize(table, b, _block_size).data() + in_block, src.data() + read, size_t(n));

                read += n;
                in_block = 0;
                ++b;
            }
        });
}

void lb::block_store::load_block(isize block_idx, lb::span<byte> dst) const
{
    LB_ASSERT(dst.size() <= _block_size, "cannot load more than one block");

    if (dst.empty())
        return;

    _blocks.lock(
        [&](block_table const& table)
        {
            auto const it = table.find(block_idx);
            if (it == table.end())
                std::memset(dst.data(), 0, size_t(dst.size()));
            else
                std::memcpy(dst.data(), it->second.data(), size_t(dst.size()));
        });
}

void lb::block_store::adopt_block(isize block_idx, block data)
{
    LB_ASSERT(data.size() == _block_size, "adopted blocks must span the full block size");

    _blocks.lock(
        [&](block_table& table)
        {
            auto const [it, inserted] = table.emplace(block_idx, lb::move(data));
            LB_ASSERT(inserted, "cannot adopt a block that is already materialized");
            LB_UNUSED(it);
        });
}

lb::isize lb::block_store::block_count() const
{
    return _blocks.lock([](block_table const& table) { return isize(table.size()); });
}

bool lb::block_store::is_materialized(isize block_idx) const
{
    return _blocks.lock([&](block_table const& table) { return table.contains(block_idx); });
}
