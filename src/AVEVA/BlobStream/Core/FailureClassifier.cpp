// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Core/FailureClassifier.hpp"
#include "AVEVA/BlobStream/Core/BlobStreamException.hpp"
#include "AVEVA/BlobStream/Core/StorageException.hpp"
namespace AVEVA::BlobStream::Core
{
    std::string_view ToString(const FailureKind kind) noexcept
    {
        switch (kind)
        {
        case FailureKind::NotFound:
            return "NotFound";
        case FailureKind::Retryable:
            return "Retryable";
        case FailureKind::Misuse:
            return "Misuse";
        default:
            return "Unknown";
        }
    }

    FailureKind FailureClassifier::Classify(const std::exception& error) noexcept
    {
        if (dynamic_cast<const BlobNotFoundException*>(&error) != nullptr)
        {
            return FailureKind::NotFound;
        }

        if (const auto* storageError = dynamic_cast<const StorageException*>(&error))
        {
            return storageError->IsNotFound() ? FailureKind::NotFound : FailureKind::Retryable;
        }

        return FailureKind::Misuse;
    }
}
