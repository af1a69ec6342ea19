// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
namespace AVEVA::BlobStream::Core
{
    /// <summary>
    /// A failure reported by the blob store transport.
    ///
    /// The status code is the HTTP status of the failed request, or 0 when no response was received.
    /// </summary>
    class StorageException : public std::runtime_error
    {
        int32_t m_statusCode;
    public:
        static const constexpr int32_t NoResponse = 0;
        static const constexpr int32_t NotFoundStatus = 404;

        StorageException(int32_t statusCode, const std::string& message);

        int32_t GetStatusCode() const noexcept;
        bool IsNotFound() const noexcept;
    };
}
