// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Core/StorageException.hpp"
namespace AVEVA::BlobStream::Core
{
    StorageException::StorageException(const int32_t statusCode, const std::string& message)
        : std::runtime_error(message),
        m_statusCode(statusCode)
    {
    }

    int32_t StorageException::GetStatusCode() const noexcept
    {
        return m_statusCode;
    }

    bool StorageException::IsNotFound() const noexcept
    {
        return m_statusCode == NotFoundStatus;
    }
}
