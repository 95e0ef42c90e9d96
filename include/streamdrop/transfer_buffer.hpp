#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace streamdrop {

// Read-once view of a completed transfer. Owns its bytes; the upload path
// drains it front to back.
class ByteStream {
public:
    ByteStream() = default;
    ByteStream(std::vector<char> bytes, std::size_t cursor);

    ByteStream(ByteStream&&) noexcept = default;
    ByteStream& operator=(ByteStream&&) noexcept = default;
    ByteStream(const ByteStream&) = delete;
    ByteStream& operator=(const ByteStream&) = delete;

    std::size_t read(char* out, std::size_t max_bytes);
    std::string readAll();

    [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }
    [[nodiscard]] std::size_t remaining() const noexcept { return bytes_.size() - cursor_; }
    [[nodiscard]] bool exhausted() const noexcept { return cursor_ >= bytes_.size(); }

private:
    std::vector<char> bytes_;
    std::size_t cursor_{0};
};

// Append-only in-memory sink the download engine writes into. It replaces the
// temporary file a naive downloader would use; nothing touches the disk.
class TransferBuffer {
public:
    TransferBuffer() = default;

    TransferBuffer(TransferBuffer&&) noexcept = default;
    TransferBuffer& operator=(TransferBuffer&&) noexcept = default;
    TransferBuffer(const TransferBuffer&) = delete;
    TransferBuffer& operator=(const TransferBuffer&) = delete;

    void write(const char* data, std::size_t size);

    // Drops everything written so far. Only the full-download fallback uses it.
    void truncate() noexcept;

    void seekStart() noexcept { read_cursor_ = 0; }

    [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }
    [[nodiscard]] std::size_t readPosition() const noexcept { return read_cursor_; }
    [[nodiscard]] bool empty() const noexcept { return bytes_.empty(); }

    // Hands the content over to the consumer. The buffer is left empty.
    [[nodiscard]] ByteStream asReadableStream() &&;

private:
    std::vector<char> bytes_;
    std::size_t read_cursor_{0};
};

} // namespace streamdrop
