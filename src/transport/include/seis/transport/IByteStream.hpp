// /////////////////////////////////////////////////////////////////////////////
/// @file IByteStream.hpp
/// @brief Pull-based transport: exclusive reader lease plus blocking read.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/transport/ITransport.hpp>

#include <string>

namespace seis::transport {

class IByteStream;

/// @brief One decoded chunk of inbound text.
struct ReadChunk
{
    std::string text;
    /// The device hung up; no further data will arrive.
    bool endOfStream{false};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class ReaderLease
/// @brief Move-only RAII handle on a stream's single reader slot.
///
/// The slot is released exactly once: by release() or by the destructor,
/// whichever runs first.  A moved-from lease releases nothing.
// /////////////////////////////////////////////////////////////////////////////
class ReaderLease final
{
public:
    ReaderLease() noexcept = default;
    ~ReaderLease() { release(); }

    ReaderLease(const ReaderLease&)            = delete;
    ReaderLease& operator=(const ReaderLease&) = delete;

    ReaderLease(ReaderLease&& other) noexcept
        : stream_{other.stream_}
    {
        other.stream_ = nullptr;
    }

    ReaderLease& operator=(ReaderLease&& other) noexcept
    {
        if (this != &other)
        {
            release();
            stream_ = other.stream_;
            other.stream_ = nullptr;
        }
        return *this;
    }

    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return stream_ != nullptr; }

private:
    friend class IByteStream;
    explicit ReaderLease(IByteStream* stream) noexcept : stream_{stream} {}

    IByteStream* stream_{nullptr};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IByteStream
/// @brief A transport whose inbound side is read by a pull loop.
///
/// Only one reader may hold the stream at a time.  close() is refused while
/// a lease is outstanding: the read loop must be cancelled first.
// /////////////////////////////////////////////////////////////////////////////
class IByteStream : public ITransport
{
public:
    /// @brief Claims the reader slot.
    /// @return kReaderLocked if another lease is held, kDeviceClosed if the
    ///         stream is not open.
    [[nodiscard]] core::Expected<ReaderLease> acquireReader()
    {
        SEIS_TRY_VOID(lockReader());
        return ReaderLease{this};
    }

    /// @brief Waits up to the configured read timeout for inbound text.
    ///
    /// An empty, non-final chunk means the timeout elapsed; callers poll
    /// their stop condition and read again.  Requires a held lease.
    [[nodiscard]] virtual core::Expected<ReadChunk> read() = 0;

protected:
    [[nodiscard]] virtual core::ExpectedVoid lockReader() = 0;
    virtual void unlockReader() noexcept = 0;

private:
    friend class ReaderLease;
};

inline void ReaderLease::release() noexcept
{
    if (stream_ != nullptr)
    {
        stream_->unlockReader();
        stream_ = nullptr;
    }
}

} // namespace seis::transport
