#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ogcode::stream {

/**
 * @brief Byte staging area for frame records, batch headers and file headers.
 *
 * All multi-byte integers are little-endian regardless of host order, so a
 * recording written on one machine replays on any other.
 */
class ByteBuffer {
public:
    explicit ByteBuffer(std::size_t reserveBytes = 4096);

    void clear() { bytes.clear(); }

    void appendBytes(std::string_view text);

    template<typename T>
    void appendLE(T value) {
        static_assert(std::is_unsigned_v<T>, "little-endian fields are unsigned");
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            bytes.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
        }
    }

    /// Overwrite a field appended earlier, e.g. a count known only at the end.
    template<typename T>
    void patchLE(std::size_t offset, T value) {
        static_assert(std::is_unsigned_v<T>, "little-endian fields are unsigned");
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            bytes.at(offset + i) = static_cast<std::uint8_t>(value >> (8 * i));
        }
    }

    const std::uint8_t* data() const { return bytes.data(); }
    std::size_t size() const { return bytes.size(); }
    bool empty() const { return bytes.empty(); }

private:
    std::vector<std::uint8_t> bytes;
};

template<typename T>
T readLE(const std::uint8_t* data) {
    static_assert(std::is_unsigned_v<T>, "little-endian fields are unsigned");
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>(value | (static_cast<T>(data[i]) << (8 * i)));
    }
    return value;
}

} // namespace ogcode::stream
