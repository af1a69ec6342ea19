// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Azure/Impl/BlobReadChannel.hpp"
#include "AVEVA/BlobStream/Azure/Impl/BlobHelpers.hpp"
#include "AVEVA/BlobStream/Azure/AzureErrorTranslator.hpp"
#include "AVEVA/BlobStream/Core/BlobStreamException.hpp"
#include "AVEVA/BlobStream/Core/Configuration.hpp"

#include <azure/core/exception.hpp>

#include <algorithm>
#include <cassert>
namespace AVEVA::BlobStream::Azure::Impl
{
    BlobReadChannel::BlobReadChannel(Core::BlobLocator locator, ::Azure::Storage::Blobs::BlobClient client)
        : m_locator(std::move(locator)),
        m_client(std::move(client)),
        m_chunkSize(Core::Configuration::ReadChannel::DefaultChunkSize),
        m_position(0),
        m_bufferOffset(0),
        m_endOfBlob(false),
        m_open(true)
    {
    }

    void BlobReadChannel::Seek(const int64_t offset)
    {
        EnsureOpen();
        assert(offset >= 0 && "Can't seek to a negative offset");
        m_position = offset;
        m_buffer.clear();
        m_bufferOffset = 0;
        m_endOfBlob = false;
    }

    void BlobReadChannel::SetFetchChunkSize(const int64_t chunkSize) noexcept
    {
        m_chunkSize = chunkSize > 0 ? chunkSize : Core::Configuration::ReadChannel::DefaultChunkSize;
    }

    int64_t BlobReadChannel::Fetch(std::span<char> buffer)
    {
        EnsureOpen();
        if (buffer.empty())
        {
            return 0;
        }

        if (m_bufferOffset >= m_buffer.size())
        {
            if (m_endOfBlob)
            {
                return EndOfStream;
            }

            if (!DownloadChunk(std::max(m_chunkSize, static_cast<int64_t>(buffer.size()))))
            {
                return EndOfStream;
            }
        }

        const auto bytesToCopy = std::min(m_buffer.size() - m_bufferOffset, buffer.size());
        std::copy_n(m_buffer.begin() + static_cast<std::ptrdiff_t>(m_bufferOffset), bytesToCopy, buffer.begin());
        m_bufferOffset += bytesToCopy;
        m_position += static_cast<int64_t>(bytesToCopy);
        return static_cast<int64_t>(bytesToCopy);
    }

    bool BlobReadChannel::IsOpen() const
    {
        return m_open;
    }

    void BlobReadChannel::Close()
    {
        m_open = false;
        m_buffer.clear();
        m_buffer.shrink_to_fit();
        m_bufferOffset = 0;
    }

    int64_t BlobReadChannel::GetChunkSize() const noexcept
    {
        return m_chunkSize;
    }

    void BlobReadChannel::EnsureOpen() const
    {
        if (!m_open)
        {
            throw Core::StreamMisuseException("Read channel for [" + m_locator.ToString() + "] is closed");
        }
    }

    bool BlobReadChannel::DownloadChunk(const int64_t length)
    {
        m_buffer.resize(static_cast<size_t>(length));
        m_bufferOffset = 0;
        try
        {
            const auto downloaded = BlobHelpers::DownloadRange(m_client, m_position, m_buffer);
            assert(downloaded >= 0 && downloaded <= length);
            m_buffer.resize(static_cast<size_t>(downloaded));
            if (downloaded < length)
            {
                m_endOfBlob = true;
            }
        }
        catch (const ::Azure::Core::RequestFailedException& e)
        {
            m_buffer.clear();

            // Asking for a range that starts at or past the end of the blob.
            if (e.StatusCode == ::Azure::Core::Http::HttpStatusCode::RangeNotSatisfiable)
            {
                m_endOfBlob = true;
                return false;
            }

            throw AzureErrorTranslator::StorageExceptionFromError("Failed reading [" + m_locator.ToString() + "] at offset [" + std::to_string(m_position) + "]", e);
        }

        return !m_buffer.empty();
    }
}
