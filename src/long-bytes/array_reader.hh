#pragma once

#include <long-bytes/array_ref.hh>
#include <long-bytes/fwd.hh>
#include <long-bytes/span.hh>

#include <optional>

/// Sequential reader over any array, with a cursor and a mark/reset position.
///
/// Reaching the end of the array is not an error: read() returns nullopt and the bulk read
/// returns 0. The reader never writes to the array and does not own a lock; concurrent writers
/// are observed per call.
///
/// Usage:
///   auto reader = lb::array_reader(arr);
///   while (auto b = reader.read())
///       consume(*b);
struct lb::array_reader
{
    /// null_base if `source` is empty
    explicit array_reader(array_ref source);

    /// next byte, or nullopt at end of data
    [[nodiscard]] std::optional<byte> read();

    /// fills `dst` from the front with up to dst.size() bytes using a single sub-array copy
    /// returns the number of bytes read, 0 at end of data
    isize read(lb::span<byte> dst);

    /// advances the cursor by up to `count` bytes, returns how far it moved
    /// invalid_argument if count < 0
    isize skip(isize count);

    /// bytes left until end of data
    [[nodiscard]] isize available() const { return _source.length() - _position; }

    [[nodiscard]] isize position() const { return _position; }

    /// remembers the current position for reset(), initially 0
    void mark() { _marked = _position; }

    /// moves the cursor back to the last mark()
    void reset() { _position = _marked; }

    [[nodiscard]] array_ref const& source() const { return _source; }

private:
    array_ref _source;
    isize _position = 0;
    isize _marked = 0;
};
