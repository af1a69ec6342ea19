// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
#include <span>
namespace AVEVA::BlobStream::Core
{
    class ReadChannel
    {
    public:
        static const constexpr int64_t EndOfStream = -1;

        virtual ~ReadChannel() = default;

        /// <summary>
        /// Moves the read position of the channel.
        /// </summary>
        /// <param name="offset">The absolute offset in the blob to read from next.</param>
        virtual void Seek(int64_t offset) = 0;

        /// <summary>
        /// Sets how many bytes a single request to the store asks for.
        /// A fetch requests the larger of this value and the size of the destination buffer.
        /// </summary>
        /// <param name="chunkSize">The chunk size in bytes, or 0 to restore the default.</param>
        virtual void SetFetchChunkSize(int64_t chunkSize) noexcept = 0;

        /// <summary>
        /// Reads the next bytes of the blob into the buffer.
        /// </summary>
        /// <param name="buffer">The destination of the bytes.</param>
        /// <returns>
        /// The number of bytes read, at least 1 for a non-empty buffer, or EndOfStream when the end of the
        /// blob has been reached.
        /// </returns>
        /// <exception cref="StorageException">The request to the store failed.</exception>
        virtual int64_t Fetch(std::span<char> buffer) = 0;

        virtual bool IsOpen() const = 0;
        virtual void Close() = 0;
    };
}
