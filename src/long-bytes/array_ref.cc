#include "array_ref.hh"

#include <long-bytes/error.hh>
#include <long-bytes/linked_byte_array.hh>
#include <long-bytes/long_byte_array.hh>

lb::array_ref::array_ref(std::shared_ptr<long_byte_array> array)
{
    if (array != nullptr)
        _target = lb::move(array);
}

lb::array_ref::array_ref(std::shared_ptr<linked_byte_array> view)
{
    if (view != nullptr)
        _target = lb::move(view);
}

template <class F>
decltype(auto) lb::array_ref::dispatch(F&& f) const
{
    if (auto const* array = std::get_if<std::shared_ptr<long_byte_array>>(&_target))
        return f(**array);
    if (auto const* view = std::get_if<std::shared_ptr<linked_byte_array>>(&_target))
        return f(**view);

    impl::throw_error(error_kind::null_base, "operation on an empty array_ref");
}

std::shared_ptr<lb::long_byte_array> lb::array_ref::as_array() const
{
    auto const* array = std::get_if<std::shared_ptr<long_byte_array>>(&_target);
    return array ? *array : nullptr;
}

std::shared_ptr<lb::linked_byte_array> lb::array_ref::as_view() const
{
    auto const* view = std::get_if<std::shared_ptr<linked_byte_array>>(&_target);
    return view ? *view : nullptr;
}

lb::isize lb::array_ref::length() const
{
    return dispatch([](auto& a) { return a.length(); });
}

lb::byte lb::array_ref::get(isize index) const
{
    return dispatch([&](auto& a) { return a.get(index); });
}

void lb::array_ref::put(isize index, byte value) const
{
    dispatch([&](auto& a) { a.put(index, value); });
}

void lb::array_ref::put_range(isize offset, lb::span<byte const> data) const
{
    dispatch([&](auto& a) { a.put_range(offset, data); });
}

lb::unique_array<lb::byte> lb::array_ref::get_sub_array(isize offset, isize count) const
{
    return dispatch([&](auto& a) { return a.get_sub_array(offset, count); });
}

lb::unique_array<lb::byte> lb::array_ref::to_regular_array() const
{
    return dispatch([](auto& a) { return a.to_regular_array(); });
}

void lb::array_ref::write(lb::byte_sink sink) const
{
    dispatch([&](auto& a) { a.write(sink); });
}

std::string lb::array_ref::to_string() const
{
    if (!is_valid())
        return "array_ref[empty]";

    return dispatch([](auto& a) { return a.to_string(); });
}
