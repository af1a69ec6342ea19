// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstddef>
#include <cstdint>
namespace AVEVA::BlobStream::Core
{
    struct Configuration
    {
        struct ReadChannel
        {
            // A chunk size of 0 tells the channel to use its own default.
            static const constexpr int64_t UseDefaultChunkSize = 0;
            static const constexpr int64_t DefaultChunkSize = static_cast<int64_t>(2) * 1024 * 1024; // 2MB
        };

        // Entries past this are dropped without being counted.
        static const constexpr size_t MaxSuppressedFailures = 10;
        static const constexpr int MaxClientRetries = 8;
    };
}
