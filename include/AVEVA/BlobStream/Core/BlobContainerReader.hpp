// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/BlobStoreClient.hpp"
#include "AVEVA/BlobStream/Core/PrivilegedExecutor.hpp"
#include "AVEVA/BlobStream/Core/RangeStream.hpp"

#include <boost/log/trivial.hpp>

#include <cstdint>
#include <memory>
#include <string>
namespace AVEVA::BlobStream::Core
{
    class BlobContainerReader
    {
        std::shared_ptr<BlobStoreClient> m_client;
        std::string m_container;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
        PrivilegedExecutor m_executor;

    public:
        BlobContainerReader(std::shared_ptr<BlobStoreClient> client,
            std::string container,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            PrivilegedExecutor executor = {});

        /// <summary>
        /// Opens the whole blob for reading.
        /// </summary>
        /// <exception cref="BlobNotFoundException">The blob does not exist.</exception>
        [[nodiscard]] std::unique_ptr<RangeStream> ReadBlob(const std::string& name) const;

        /// <summary>
        /// Opens length bytes of the blob starting at position for reading.
        /// A range that runs past the end of the blob stops at the end of the blob.
        /// </summary>
        /// <exception cref="std::invalid_argument">position or length is negative.</exception>
        /// <exception cref="BlobNotFoundException">The blob does not exist.</exception>
        [[nodiscard]] std::unique_ptr<RangeStream> ReadBlob(const std::string& name, int64_t position, int64_t length) const;

        const std::string& GetContainer() const noexcept;
    };
}
