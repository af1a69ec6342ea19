// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/BlobStoreClient.hpp"
#include "AVEVA/BlobStream/Core/Configuration.hpp"

#include <azure/storage/blobs/blob_service_client.hpp>
namespace AVEVA::BlobStream::Azure::Impl
{
    class AzureBlobStoreClient final : public Core::BlobStoreClient
    {
        ::Azure::Storage::Blobs::BlobServiceClient m_client;
        int m_maxRetries;

    public:
        /// <param name="client">The service client to read through.</param>
        /// <param name="maxRetries">The Retry.MaxRetries the client was created with.</param>
        explicit AzureBlobStoreClient(::Azure::Storage::Blobs::BlobServiceClient client, int maxRetries = Core::Configuration::MaxClientRetries);

        virtual std::unique_ptr<Core::ReadChannel> OpenReadChannel(const Core::BlobLocator& locator) override;
        virtual int GetMaxTransportAttempts() const override;
    };
}
