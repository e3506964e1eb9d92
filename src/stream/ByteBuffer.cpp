#include "ogcode/stream/ByteBuffer.hpp"

namespace ogcode::stream {

ByteBuffer::ByteBuffer(std::size_t reserveBytes) {
    bytes.reserve(reserveBytes);
}

void ByteBuffer::appendBytes(std::string_view text) {
    bytes.insert(bytes.end(), text.begin(), text.end());
}

} // namespace ogcode::stream
