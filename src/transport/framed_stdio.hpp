// src/transport/framed_stdio.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace transport
{

    // v1 sim limit: 1 MiB frames
    constexpr uint32_t kMaxFrameBytes = 1024u * 1024u;

    // Buffered reader of length-prefixed frames (uint32_le + payload bytes)
    // arriving on a file descriptor. Does not own the fd.
    class FrameReader
    {
    public:
        explicit FrameReader(int fd, uint32_t max_len = kMaxFrameBytes);

        // Waits up to timeout_s for the fd to become readable and appends the
        // available bytes to the internal buffer. timeout_s == 0 polls.
        // Returns:
        //  - true  => no error (possibly no new bytes; check eof())
        //  - false => fatal IO error (err non-empty)
        bool wait(double timeout_s, std::string &err);

        // Extracts one complete frame from the buffer.
        // Returns:
        //  - true  => frame moved into out
        //  - false => no complete frame yet (err empty) or fatal protocol
        //             error (err non-empty)
        bool next_frame(std::vector<uint8_t> &out, std::string &err);

        // Peer closed its end. Buffered frames can still be extracted.
        bool eof() const { return eof_; }

        size_t buffered_bytes() const { return buffer_.size(); }

    private:
        int fd_;
        uint32_t max_len_;
        bool eof_ = false;
        std::vector<uint8_t> buffer_;
    };

    // Writes one length-prefixed frame (uint32_le + payload bytes) to fd.
    // Returns false on error and sets err.
    bool write_frame(int fd, const uint8_t *data, size_t len, std::string &err,
                     uint32_t max_len = kMaxFrameBytes);

} // namespace transport
