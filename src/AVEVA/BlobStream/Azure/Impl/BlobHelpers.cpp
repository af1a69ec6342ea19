// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Azure/Impl/BlobHelpers.hpp"
namespace AVEVA::BlobStream::Azure::Impl
{
    ::Azure::Storage::Blobs::BlobClientOptions BlobHelpers::CreateBlobClientOptions(const int maxRetries)
    {
        auto opts = ::Azure::Storage::Blobs::BlobClientOptions();
        opts.Retry.MaxRetries = maxRetries;
        return opts;
    }

    int64_t BlobHelpers::DownloadRange(const ::Azure::Storage::Blobs::BlobClient& client, const int64_t blobOffset, std::span<char> buffer)
    {
        ::Azure::Storage::Blobs::DownloadBlobToOptions options
        {
            .Range = ::Azure::Core::Http::HttpRange { blobOffset, static_cast<int64_t>(buffer.size()) }
        };

        const auto result = client.DownloadTo(reinterpret_cast<uint8_t*>(buffer.data()), buffer.size(), options);
        const auto& downloadedLength = result.Value.ContentRange.Length;
        return downloadedLength.ValueOr(0);
    }
}
