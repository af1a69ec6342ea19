// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/BlobLocator.hpp"
#include "AVEVA/BlobStream/Core/ReadChannel.hpp"

#include <azure/storage/blobs/blob_client.hpp>

#include <cstdint>
#include <vector>
namespace AVEVA::BlobStream::Azure::Impl
{
    /// <summary>
    /// Reads a blob front to back with ranged GET requests.
    ///
    /// Each request asks for max(chunk size, destination size) bytes and keeps what the caller did
    /// not take for the following fetches. Nothing is requested until the first fetch, so a missing
    /// blob shows up there as a StorageException with a not found status.
    /// </summary>
    class BlobReadChannel final : public Core::ReadChannel
    {
        Core::BlobLocator m_locator;
        ::Azure::Storage::Blobs::BlobClient m_client;
        int64_t m_chunkSize;
        int64_t m_position;
        std::vector<char> m_buffer;
        size_t m_bufferOffset;
        bool m_endOfBlob;
        bool m_open;

    public:
        BlobReadChannel(Core::BlobLocator locator, ::Azure::Storage::Blobs::BlobClient client);

        virtual void Seek(int64_t offset) override;
        virtual void SetFetchChunkSize(int64_t chunkSize) noexcept override;
        virtual int64_t Fetch(std::span<char> buffer) override;
        virtual bool IsOpen() const override;
        virtual void Close() override;

        int64_t GetChunkSize() const noexcept;

    private:
        void EnsureOpen() const;
        [[nodiscard]] bool DownloadChunk(int64_t length);
    };
}
