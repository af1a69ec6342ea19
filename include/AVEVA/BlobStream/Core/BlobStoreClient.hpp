// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/BlobLocator.hpp"
#include "AVEVA/BlobStream/Core/ReadChannel.hpp"

#include <memory>
namespace AVEVA::BlobStream::Core
{
    class BlobStoreClient
    {
    public:
        BlobStoreClient() = default;
        virtual ~BlobStoreClient() = default;

        virtual std::unique_ptr<ReadChannel> OpenReadChannel(const BlobLocator& locator) = 0;

        /// <returns>How many times the transport tries a single request before giving up.</returns>
        virtual int GetMaxTransportAttempts() const = 0;
    };
}
