// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Core/ByteRange.hpp"

#include <stdexcept>
#include <string>
namespace AVEVA::BlobStream::Core
{
    ByteRange::ByteRange(const int64_t start, const int64_t length)
        : m_start(start),
        m_length(length)
    {
        if (start < 0)
        {
            throw std::invalid_argument("Range start must be non-negative but was " + std::to_string(start));
        }
    }

    ByteRange ByteRange::Unbounded(const int64_t start)
    {
        return ByteRange{ start, -1 };
    }

    int64_t ByteRange::GetStart() const noexcept
    {
        return m_start;
    }

    int64_t ByteRange::GetLength() const noexcept
    {
        return m_length;
    }

    bool ByteRange::IsUnbounded() const noexcept
    {
        return m_length < 0 || m_length > UnboundedEnd - m_start;
    }

    int64_t ByteRange::GetEnd() const noexcept
    {
        return IsUnbounded() ? UnboundedEnd : m_start + m_length;
    }
}
