// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Core/BoundedByteSource.hpp"
#include "AVEVA/BlobStream/Core/BlobStreamException.hpp"
#include "AVEVA/BlobStream/Core/Configuration.hpp"
#include "AVEVA/BlobStream/Core/StorageException.hpp"

#include <cassert>
#include <string>
namespace AVEVA::BlobStream::Core
{
    namespace
    {
        // Puts the channel back on its default chunk size once the fetch is done, however it ended.
        class ChunkSizeRestorer
        {
            ReadChannel& m_channel;
        public:
            explicit ChunkSizeRestorer(ReadChannel& channel)
                : m_channel(channel)
            {
            }

            ~ChunkSizeRestorer()
            {
                m_channel.SetFetchChunkSize(Configuration::ReadChannel::UseDefaultChunkSize);
            }

            ChunkSizeRestorer(const ChunkSizeRestorer&) = delete;
            ChunkSizeRestorer& operator=(const ChunkSizeRestorer&) = delete;
        };
    }

    BoundedByteSource::BoundedByteSource(BlobLocator locator,
        std::unique_ptr<ReadChannel> channel,
        const ByteRange& range,
        PrivilegedExecutor executor)
        : m_locator(std::move(locator)),
        m_channel(std::move(channel)),
        m_executor(std::move(executor)),
        m_end(range.GetEnd()),
        m_position(0)
    {
    }

    std::unique_ptr<BoundedByteSource> BoundedByteSource::Open(BlobStoreClient& client,
        const BlobLocator& locator,
        const ByteRange& range,
        const int64_t resumeOffset,
        const PrivilegedExecutor& executor)
    {
        assert(resumeOffset >= 0 && "resumeOffset can't be negative");
        std::unique_ptr<ReadChannel> channel;
        try
        {
            channel = executor.Run([&client, &locator]() { return client.OpenReadChannel(locator); });
        }
        catch (const StorageException& e)
        {
            if (e.IsNotFound())
            {
                throw BlobNotFoundException(locator, e.what());
            }

            throw;
        }

        auto source = std::make_unique<BoundedByteSource>(locator, std::move(channel), range, executor);
        if (resumeOffset > 0 || range.GetStart() > 0)
        {
            try
            {
                source->Seek(range.GetStart() + resumeOffset);
            }
            catch (const std::exception&)
            {
                source->CloseAfterFailure();
                throw;
            }
        }

        return source;
    }

    int64_t BoundedByteSource::Read(std::span<char> buffer)
    {
        const auto remaining = GetRemaining();
        assert(remaining >= 0 && "position moved past the end of the range");
        if (remaining <= 0)
        {
            return EndOfStream;
        }

        if (buffer.empty())
        {
            return 0;
        }

        // The channel requests max(chunk size, buffer size) from the store. When we know
        // how much is left we only ask for that.
        if (remaining < Configuration::ReadChannel::DefaultChunkSize)
        {
            m_channel->SetFetchChunkSize(remaining);
        }

        if (remaining < static_cast<int64_t>(buffer.size()))
        {
            buffer = buffer.first(static_cast<size_t>(remaining));
        }

        ChunkSizeRestorer restorer(*m_channel);
        try
        {
            const auto bytesRead = m_executor.Run([this, buffer]() { return m_channel->Fetch(buffer); });
            if (bytesRead == 0)
            {
                throw StorageException(StorageException::NoResponse,
                    "Read channel for [" + m_locator.ToString() + "] returned no data at offset [" + std::to_string(m_position) + "]");
            }

            if (bytesRead > 0)
            {
                m_position += bytesRead;
            }

            return bytesRead;
        }
        catch (const StorageException& e)
        {
            if (e.IsNotFound())
            {
                throw BlobNotFoundException(m_locator, e.what());
            }

            throw;
        }
    }

    int64_t BoundedByteSource::GetPosition() const noexcept
    {
        return m_position;
    }

    int64_t BoundedByteSource::GetRemaining() const noexcept
    {
        return m_end - m_position;
    }

    bool BoundedByteSource::IsOpen() const
    {
        return m_channel && m_executor.Run([this]() { return m_channel->IsOpen(); });
    }

    void BoundedByteSource::Close()
    {
        m_executor.Run([this]() { m_channel->Close(); });
    }

    void BoundedByteSource::CloseAfterFailure() noexcept
    {
        try
        {
            Close();
        }
        catch (const std::exception&)
        {
            // NOTE: The failure that got us here is the one the caller sees
        }
    }

    void BoundedByteSource::Seek(const int64_t offset)
    {
        try
        {
            m_executor.Run([this, offset]() { m_channel->Seek(offset); });
        }
        catch (const StorageException& e)
        {
            if (e.IsNotFound())
            {
                throw BlobNotFoundException(m_locator, e.what());
            }

            throw;
        }

        m_position = offset;
    }
}
