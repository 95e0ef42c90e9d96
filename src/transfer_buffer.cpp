#include "streamdrop/transfer_buffer.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace streamdrop {

ByteStream::ByteStream(std::vector<char> bytes, std::size_t cursor)
    : bytes_(std::move(bytes)), cursor_(std::min(cursor, bytes_.size())) {}

std::size_t ByteStream::read(char* out, std::size_t max_bytes) {
    const std::size_t count = std::min(max_bytes, remaining());
    if (count == 0) {
        return 0;
    }
    std::memcpy(out, bytes_.data() + cursor_, count);
    cursor_ += count;
    return count;
}

std::string ByteStream::readAll() {
    std::string out(bytes_.begin() + static_cast<std::ptrdiff_t>(cursor_), bytes_.end());
    cursor_ = bytes_.size();
    return out;
}

void TransferBuffer::write(const char* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    bytes_.insert(bytes_.end(), data, data + size);
}

void TransferBuffer::truncate() noexcept {
    bytes_.clear();
    read_cursor_ = 0;
}

ByteStream TransferBuffer::asReadableStream() && {
    ByteStream stream{std::move(bytes_), read_cursor_};
    bytes_.clear();
    read_cursor_ = 0;
    return stream;
}

} // namespace streamdrop
