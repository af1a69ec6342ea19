// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
#include <limits>
namespace AVEVA::BlobStream::Core
{
    /// <summary>
    /// A window over a blob starting at Start and spanning Length bytes.
    ///
    /// A negative length, or one that would overflow when added to the start, means the
    /// range runs to the natural end of the blob.
    /// </summary>
    class ByteRange
    {
        int64_t m_start;
        int64_t m_length;
    public:
        static const constexpr int64_t UnboundedEnd = std::numeric_limits<int64_t>::max();

        ByteRange(int64_t start, int64_t length);
        static ByteRange Unbounded(int64_t start = 0);

        int64_t GetStart() const noexcept;
        int64_t GetLength() const noexcept;
        bool IsUnbounded() const noexcept;

        /// <returns>The exclusive end offset in the blob, or UnboundedEnd.</returns>
        int64_t GetEnd() const noexcept;
    };
}
