// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/StorageException.hpp"

#include <cstdint>
namespace AVEVA::BlobStream::Core
{
    struct FailureRecord
    {
        StorageException Error;

        /// <summary>
        /// Bytes delivered to the caller, relative to the range start, when the failure happened.
        /// </summary>
        int64_t Offset;

        int Attempt;
    };
}
