// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Core/RangeStream.hpp"
#include "AVEVA/BlobStream/Core/FailureClassifier.hpp"

#include <cassert>
namespace AVEVA::BlobStream::Core
{
    using namespace boost::log::trivial;

    std::string_view ToString(const StreamState state) noexcept
    {
        switch (state)
        {
        case StreamState::Reading:
            return "Reading";
        case StreamState::Reopening:
            return "Reopening";
        case StreamState::FailedNotFound:
            return "FailedNotFound";
        case StreamState::FailedExhausted:
            return "FailedExhausted";
        case StreamState::Closed:
            return "Closed";
        default:
            return "Unknown";
        }
    }

    template <typename ReadOperation>
    int64_t RangeStream::ReadWithRetries(ReadOperation&& read)
    {
        while (true)
        {
            try
            {
                if (m_state == StreamState::Reopening)
                {
                    OpenSource();
                }

                return read(*m_source);
            }
            catch (BlobNotFoundException& e)
            {
                m_state = StreamState::FailedNotFound;
                AddSuppressedFailures(e);
                throw;
            }
            catch (const StorageException& e)
            {
                ReopenOrFail(e);
            }
        }
    }

    RangeStream::RangeStream(std::shared_ptr<BlobStoreClient> client,
        BlobLocator locator,
        ByteRange range,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        PrivilegedExecutor executor)
        : m_client(std::move(client)),
        m_locator(std::move(locator)),
        m_range(range),
        m_executor(std::move(executor)),
        m_logger(std::move(logger)),
        m_maxRetries(m_client->GetMaxTransportAttempts() + 1),
        m_state(StreamState::Reopening),
        m_attempt(1),
        m_offset(0)
    {
        [[maybe_unused]] const auto opened = ReadWithRetries([](BoundedByteSource&) { return static_cast<int64_t>(0); });
    }

    RangeStream::~RangeStream()
    {
        try
        {
            Close();
        }
        catch (const std::exception& e)
        {
            BOOST_LOG_SEV(*m_logger, warning) << "Failed to close stream for [" << m_locator << "]: " << e.what();
        }
    }

    int RangeStream::ReadByte()
    {
        char value = 0;
        const auto bytesRead = Read(std::span<char>(&value, 1));
        if (bytesRead == EndOfStream)
        {
            return EndOfStream;
        }

        assert(bytesRead == 1);
        return static_cast<unsigned char>(value);
    }

    int64_t RangeStream::Read(const std::span<char> buffer)
    {
        EnsureOpen();
        if (buffer.empty())
        {
            return 0;
        }

        return ReadWithRetries([this, buffer](BoundedByteSource& source)
            {
                const auto bytesRead = source.Read(buffer);
                assert(bytesRead != 0 && "BoundedByteSource::Read returned 0 for a non-empty buffer");
                if (bytesRead == BoundedByteSource::EndOfStream)
                {
                    return static_cast<int64_t>(EndOfStream);
                }

                m_offset += bytesRead;
                return bytesRead;
            });
    }

    void RangeStream::Close()
    {
        if (m_state == StreamState::Closed)
        {
            return;
        }

        m_state = StreamState::Closed;
        CloseSourceWhileHandlingException();
    }

    void RangeStream::Skip(int64_t)
    {
        throw StreamMisuseException("RangeStream does not support seeking");
    }

    void RangeStream::Reset()
    {
        throw StreamMisuseException("RangeStream does not support seeking");
    }

    const BlobLocator& RangeStream::GetLocator() const noexcept
    {
        return m_locator;
    }

    const ByteRange& RangeStream::GetRange() const noexcept
    {
        return m_range;
    }

    StreamState RangeStream::GetState() const noexcept
    {
        return m_state;
    }

    int RangeStream::GetAttempt() const noexcept
    {
        return m_attempt;
    }

    int RangeStream::GetMaxRetries() const noexcept
    {
        return m_maxRetries;
    }

    int64_t RangeStream::GetOffset() const noexcept
    {
        return m_offset;
    }

    const RangeStream::FailureList& RangeStream::GetFailures() const noexcept
    {
        return m_failures;
    }

    void RangeStream::EnsureOpen() const
    {
        switch (m_state)
        {
        case StreamState::Closed:
            throw StreamMisuseException("Using RangeStream for [" + m_locator.ToString() + "] after close");
        case StreamState::FailedNotFound:
        case StreamState::FailedExhausted:
            throw StreamMisuseException("Using RangeStream for [" + m_locator.ToString() + "] after it failed");
        default:
            break;
        }
    }

    void RangeStream::OpenSource()
    {
        m_source = BoundedByteSource::Open(*m_client, m_locator, m_range, m_offset, m_executor);
        m_state = StreamState::Reading;
    }

    void RangeStream::ReopenOrFail(const StorageException& error)
    {
        if (FailureClassifier::Classify(error) == FailureKind::NotFound)
        {
            m_state = StreamState::FailedNotFound;
            BlobNotFoundException notFound(m_locator, error.what());
            AddSuppressedFailures(notFound);
            throw notFound;
        }

        if (m_attempt >= m_maxRetries)
        {
            m_state = StreamState::FailedExhausted;
            RetriesExhaustedException exhausted(m_locator, FailureRecord{ error, m_offset, m_attempt });
            AddSuppressedFailures(exhausted);
            throw exhausted;
        }

        BOOST_LOG_SEV(*m_logger, debug) << "Failed reading [" << m_locator << "] at offset [" << m_offset
            << "], attempt [" << m_attempt << "] of [" << m_maxRetries << "], retrying. Error: " << error.what();

        if (m_failures.size() < m_failures.capacity())
        {
            m_failures.push_back(FailureRecord{ error, m_offset, m_attempt });
        }

        m_attempt += 1;
        CloseSourceWhileHandlingException();
        m_state = StreamState::Reopening;
    }

    void RangeStream::CloseSourceWhileHandlingException()
    {
        if (!m_source)
        {
            return;
        }

        const auto source = std::move(m_source);
        try
        {
            source->Close();
        }
        catch (const std::exception& e)
        {
            BOOST_LOG_SEV(*m_logger, trace) << "Ignoring failure to close channel for [" << m_locator << "]: " << e.what();
        }
    }

    void RangeStream::AddSuppressedFailures(BlobStreamException& error) const
    {
        for (const auto& failure : m_failures)
        {
            error.AddSuppressed(failure);
        }
    }
}
