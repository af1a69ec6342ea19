// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/BlobLocator.hpp"
#include "AVEVA/BlobStream/Core/FailureRecord.hpp"

#include <stdexcept>
#include <string>
#include <vector>
namespace AVEVA::BlobStream::Core
{
    /// <summary>
    /// Base of the terminal errors a range stream raises.
    /// Carries the transient failures that were retried before the stream gave up, oldest first.
    /// </summary>
    class BlobStreamException : public std::runtime_error
    {
        BlobLocator m_locator;
        std::vector<FailureRecord> m_suppressed;
    public:
        BlobStreamException(BlobLocator locator, const std::string& message);

        const BlobLocator& GetLocator() const noexcept;
        const std::vector<FailureRecord>& GetSuppressed() const noexcept;
        void AddSuppressed(FailureRecord failure);
    };

    /// <summary>
    /// The blob does not exist. Never retried.
    /// </summary>
    class BlobNotFoundException final : public BlobStreamException
    {
    public:
        BlobNotFoundException(BlobLocator locator, const std::string& detail);
    };

    /// <summary>
    /// Every attempt the stream was allowed to make failed with a transient error.
    /// </summary>
    class RetriesExhaustedException final : public BlobStreamException
    {
        FailureRecord m_cause;
    public:
        RetriesExhaustedException(BlobLocator locator, FailureRecord cause);

        /// <returns>The failure of the final attempt.</returns>
        const FailureRecord& GetCause() const noexcept;
    };

    /// <summary>
    /// The caller used the stream in a way it does not support, e.g. reading after close.
    /// </summary>
    class StreamMisuseException final : public std::logic_error
    {
    public:
        explicit StreamMisuseException(const std::string& message);
    };
}
