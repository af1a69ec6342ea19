// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/Configuration.hpp"

#include <azure/storage/blobs/blob_client.hpp>
#include <azure/storage/blobs/blob_options.hpp>

#include <cstdint>
#include <span>
namespace AVEVA::BlobStream::Azure::Impl
{
    struct BlobHelpers
    {
        static ::Azure::Storage::Blobs::BlobClientOptions CreateBlobClientOptions(int maxRetries = Core::Configuration::MaxClientRetries);

        /// <summary>
        /// Downloads up to buffer.size() bytes of the blob starting at blobOffset.
        /// </summary>
        /// <returns>The number of bytes downloaded. Less than buffer.size() when the blob ends first.</returns>
        static int64_t DownloadRange(const ::Azure::Storage::Blobs::BlobClient& client, int64_t blobOffset, std::span<char> buffer);
    };
}
