// src/transport/framed_stdio.cpp
#include "framed_stdio.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <limits>

#include <poll.h>
#include <unistd.h>

namespace transport
{

    static inline uint32_t decode_u32_le(const uint8_t b[4])
    {
        return (static_cast<uint32_t>(b[0])) |
               (static_cast<uint32_t>(b[1]) << 8) |
               (static_cast<uint32_t>(b[2]) << 16) |
               (static_cast<uint32_t>(b[3]) << 24);
    }

    static inline void encode_u32_le(uint32_t v, uint8_t b[4])
    {
        b[0] = static_cast<uint8_t>(v & 0xFF);
        b[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
        b[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
        b[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
    }

    static bool write_all(int fd, const uint8_t *buf, size_t n)
    {
        size_t sent = 0;
        while (sent < n)
        {
            const ssize_t w = ::write(fd, buf + sent, n - sent);
            if (w < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            sent += static_cast<size_t>(w);
        }
        return true;
    }

    FrameReader::FrameReader(int fd, uint32_t max_len) : fd_(fd), max_len_(max_len) {}

    bool FrameReader::wait(double timeout_s, std::string &err)
    {
        err.clear();

        int timeout_ms = 0;
        if (timeout_s > 0.0)
            timeout_ms = static_cast<int>(std::ceil(
                std::min(timeout_s * 1000.0, static_cast<double>(std::numeric_limits<int>::max()))));

        // First poll honours the timeout; later ones only drain what is
        // already queued.
        while (!eof_)
        {
            pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = POLLIN;

            const int ready = ::poll(&pfd, 1, timeout_ms);
            if (ready < 0)
            {
                if (errno == EINTR)
                    return true;
                err = std::string("poll failed: ") + std::strerror(errno);
                return false;
            }
            if (ready == 0)
                return true;
            if ((pfd.revents & POLLNVAL) != 0)
            {
                err = "invalid file descriptor";
                return false;
            }

            // POLLHUP without POLLIN still lets read() report EOF below.
            uint8_t chunk[4096];
            const ssize_t r = ::read(fd_, chunk, sizeof(chunk));
            if (r < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    return true;
                err = std::string("read failed: ") + std::strerror(errno);
                return false;
            }
            if (r == 0)
            {
                eof_ = true;
                return true;
            }

            buffer_.insert(buffer_.end(), chunk, chunk + r);
            if (static_cast<size_t>(r) < sizeof(chunk) || buffer_.size() > max_len_ + 4u)
                return true;
            timeout_ms = 0;
        }
        return true;
    }

    bool FrameReader::next_frame(std::vector<uint8_t> &out, std::string &err)
    {
        err.clear();

        if (buffer_.size() < 4)
        {
            if (eof_ && !buffer_.empty())
                err = "unexpected EOF while reading frame header";
            return false;
        }

        const uint32_t len = decode_u32_le(buffer_.data());
        if (len == 0)
        {
            err = "invalid frame length: 0";
            return false;
        }
        if (len > max_len_)
        {
            err = "frame length exceeds max";
            return false;
        }

        if (buffer_.size() - 4 < len)
        {
            if (eof_)
                err = "unexpected EOF while reading frame payload";
            return false;
        }

        out.assign(buffer_.begin() + 4, buffer_.begin() + 4 + len);
        buffer_.erase(buffer_.begin(), buffer_.begin() + 4 + len);
        return true;
    }

    bool write_frame(int fd, const uint8_t *data, size_t len, std::string &err, uint32_t max_len)
    {
        err.clear();

        if (len == 0)
        {
            err = "invalid frame length: 0";
            return false;
        }
        if (len > max_len)
        {
            err = "frame length exceeds max";
            return false;
        }
        if (len > 0xFFFFFFFFu)
        {
            err = "frame length exceeds uint32";
            return false;
        }

        uint8_t hdr[4];
        encode_u32_le(static_cast<uint32_t>(len), hdr);

        if (!write_all(fd, hdr, 4))
        {
            err = "failed writing frame header";
            return false;
        }

        if (!write_all(fd, data, len))
        {
            err = "failed writing frame payload";
            return false;
        }

        return true;
    }

} // namespace transport
