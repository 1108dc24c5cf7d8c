#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <utility>

namespace qrdrop::server
{

    constexpr std::size_t kCopyBufferSize = 64 * 1024;

    // Receives body chunks as they arrive, forwards them untouched to `sink` and reports every
    // stored chunk to `OnBytes` before returning. A failed write returns false and reports nothing,
    // which makes the transport stop reading.
    template <typename OnBytes>
    class ProgressTrackingStream
    {
    public:
        ProgressTrackingStream(std::ostream &sink, OnBytes on_bytes)
            : sink_(sink), on_bytes_(std::move(on_bytes)) {}

        bool operator()(const char *data, std::size_t size)
        {
            sink_.write(data, static_cast<std::streamsize>(size));
            if (!sink_)
            {
                return false;
            }
            if (size > 0)
            {
                bytes_written_ += size;
                on_bytes_(size);
            }
            return true;
        }

        std::uint64_t bytes_written() const noexcept { return bytes_written_; }

    private:
        std::ostream &sink_;
        OnBytes on_bytes_;
        std::uint64_t bytes_written_{0};
    };

} // namespace qrdrop::server
