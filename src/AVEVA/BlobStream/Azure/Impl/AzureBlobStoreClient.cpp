// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Azure/Impl/AzureBlobStoreClient.hpp"
#include "AVEVA/BlobStream/Azure/Impl/BlobReadChannel.hpp"
namespace AVEVA::BlobStream::Azure::Impl
{
    AzureBlobStoreClient::AzureBlobStoreClient(::Azure::Storage::Blobs::BlobServiceClient client, const int maxRetries)
        : m_client(std::move(client)),
        m_maxRetries(maxRetries)
    {
    }

    std::unique_ptr<Core::ReadChannel> AzureBlobStoreClient::OpenReadChannel(const Core::BlobLocator& locator)
    {
        auto blobClient = m_client.GetBlobContainerClient(locator.GetContainer()).GetBlobClient(locator.GetName());
        return std::make_unique<BlobReadChannel>(locator, std::move(blobClient));
    }

    int AzureBlobStoreClient::GetMaxTransportAttempts() const
    {
        // The first try plus every retry.
        return m_maxRetries + 1;
    }
}
