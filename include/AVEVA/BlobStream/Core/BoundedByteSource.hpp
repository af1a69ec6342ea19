// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/BlobLocator.hpp"
#include "AVEVA/BlobStream/Core/BlobStoreClient.hpp"
#include "AVEVA/BlobStream/Core/ByteRange.hpp"
#include "AVEVA/BlobStream/Core/PrivilegedExecutor.hpp"
#include "AVEVA/BlobStream/Core/ReadChannel.hpp"

#include <cstdint>
#include <memory>
#include <span>
namespace AVEVA::BlobStream::Core
{
    /// <summary>
    /// A freshly opened read channel restricted to what is left of a byte range.
    ///
    /// Fetches never ask the store for bytes past the end of the range: near the end the channel's
    /// chunk size is shrunk to the remaining byte count for the duration of one fetch.
    /// A missing blob is reported as BlobNotFoundException, any other failure as the channel raised it.
    /// A fetch that returns no bytes for a non-empty buffer is reported as a StorageException without response.
    /// </summary>
    class BoundedByteSource
    {
        BlobLocator m_locator;
        std::unique_ptr<ReadChannel> m_channel;
        PrivilegedExecutor m_executor;
        int64_t m_end;
        int64_t m_position;

    public:
        static const constexpr int64_t EndOfStream = ReadChannel::EndOfStream;

        BoundedByteSource(BlobLocator locator,
            std::unique_ptr<ReadChannel> channel,
            const ByteRange& range,
            PrivilegedExecutor executor);

        /// <summary>
        /// Opens a new channel for the blob positioned at range.Start + resumeOffset.
        /// </summary>
        /// <param name="resumeOffset">Bytes of the range that were already delivered.</param>
        [[nodiscard]] static std::unique_ptr<BoundedByteSource> Open(BlobStoreClient& client,
            const BlobLocator& locator,
            const ByteRange& range,
            int64_t resumeOffset,
            const PrivilegedExecutor& executor);

        /// <returns>The number of bytes read, or EndOfStream. Only returns 0 for an empty buffer.</returns>
        [[nodiscard]] int64_t Read(std::span<char> buffer);

        // NOTE: Absolute offset in the blob
        int64_t GetPosition() const noexcept;
        int64_t GetRemaining() const noexcept;
        bool IsOpen() const;
        void Close();

    private:
        void Seek(int64_t offset);
        void CloseAfterFailure() noexcept;
    };
}
