// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Core/BlobContainerReader.hpp"

#include <stdexcept>
namespace AVEVA::BlobStream::Core
{
    BlobContainerReader::BlobContainerReader(std::shared_ptr<BlobStoreClient> client,
        std::string container,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        PrivilegedExecutor executor)
        : m_client(std::move(client)),
        m_container(std::move(container)),
        m_logger(std::move(logger)),
        m_executor(std::move(executor))
    {
    }

    std::unique_ptr<RangeStream> BlobContainerReader::ReadBlob(const std::string& name) const
    {
        return std::make_unique<RangeStream>(m_client, BlobLocator{ m_container, name }, ByteRange::Unbounded(), m_logger, m_executor);
    }

    std::unique_ptr<RangeStream> BlobContainerReader::ReadBlob(const std::string& name, const int64_t position, const int64_t length) const
    {
        if (position < 0)
        {
            throw std::invalid_argument("position must be non-negative");
        }

        if (length < 0)
        {
            throw std::invalid_argument("length must be non-negative");
        }

        return std::make_unique<RangeStream>(m_client, BlobLocator{ m_container, name }, ByteRange{ position, length }, m_logger, m_executor);
    }

    const std::string& BlobContainerReader::GetContainer() const noexcept
    {
        return m_container;
    }
}
