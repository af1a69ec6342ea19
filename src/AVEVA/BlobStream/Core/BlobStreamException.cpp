// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Core/BlobStreamException.hpp"
namespace AVEVA::BlobStream::Core
{
    BlobStreamException::BlobStreamException(BlobLocator locator, const std::string& message)
        : std::runtime_error(message),
        m_locator(std::move(locator))
    {
    }

    const BlobLocator& BlobStreamException::GetLocator() const noexcept
    {
        return m_locator;
    }

    const std::vector<FailureRecord>& BlobStreamException::GetSuppressed() const noexcept
    {
        return m_suppressed;
    }

    void BlobStreamException::AddSuppressed(FailureRecord failure)
    {
        m_suppressed.push_back(std::move(failure));
    }

    BlobNotFoundException::BlobNotFoundException(BlobLocator locator, const std::string& detail)
        : BlobStreamException(locator, "Blob object [" + locator.GetName() + "] not found: " + detail)
    {
    }

    RetriesExhaustedException::RetriesExhaustedException(BlobLocator locator, FailureRecord cause)
        : BlobStreamException(locator,
            "Failed reading [" + locator.ToString() + "] at offset [" + std::to_string(cause.Offset)
            + "] after [" + std::to_string(cause.Attempt) + "] attempts: " + cause.Error.what()),
        m_cause(std::move(cause))
    {
    }

    const FailureRecord& RetriesExhaustedException::GetCause() const noexcept
    {
        return m_cause;
    }

    StreamMisuseException::StreamMisuseException(const std::string& message)
        : std::logic_error(message)
    {
    }
}
