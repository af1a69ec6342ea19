// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/BlobLocator.hpp"
#include "AVEVA/BlobStream/Core/BlobStreamException.hpp"
#include "AVEVA/BlobStream/Core/BlobStoreClient.hpp"
#include "AVEVA/BlobStream/Core/BoundedByteSource.hpp"
#include "AVEVA/BlobStream/Core/ByteRange.hpp"
#include "AVEVA/BlobStream/Core/Configuration.hpp"
#include "AVEVA/BlobStream/Core/FailureRecord.hpp"
#include "AVEVA/BlobStream/Core/PrivilegedExecutor.hpp"
#include "AVEVA/BlobStream/Core/StorageException.hpp"

#include <boost/container/static_vector.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
namespace AVEVA::BlobStream::Core
{
    enum class StreamState
    {
        Reading,
        Reopening,
        FailedNotFound,
        FailedExhausted,
        Closed
    };

    std::string_view ToString(StreamState state) noexcept;

    /// <summary>
    /// Reads a byte range of a blob front to back, resuming where it left off when the transport
    /// fails part-way through.
    ///
    /// A transient failure closes the current channel and opens a new one positioned right after the
    /// last byte handed to the caller. The stream gives up with RetriesExhaustedException once it has
    /// failed (max transport attempts + 1) times, or immediately with BlobNotFoundException when the
    /// blob is missing. Either exception carries up to Configuration::MaxSuppressedFailures of the
    /// earlier transient failures; any further failures are dropped.
    ///
    /// Not thread safe. The blob is opened in the constructor, so a missing blob throws from there.
    /// </summary>
    class RangeStream
    {
    public:
        using FailureList = boost::container::static_vector<FailureRecord, Configuration::MaxSuppressedFailures>;
        static const constexpr int EndOfStream = -1;

    private:
        std::shared_ptr<BlobStoreClient> m_client;
        BlobLocator m_locator;
        ByteRange m_range;
        PrivilegedExecutor m_executor;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
        int m_maxRetries;

        std::unique_ptr<BoundedByteSource> m_source;
        StreamState m_state;
        int m_attempt;
        int64_t m_offset;
        FailureList m_failures;

    public:
        RangeStream(std::shared_ptr<BlobStoreClient> client,
            BlobLocator locator,
            ByteRange range,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            PrivilegedExecutor executor = {});
        ~RangeStream();

        RangeStream(const RangeStream&) = delete;
        RangeStream& operator=(const RangeStream&) = delete;

        /// <returns>The next byte (0-255), or EndOfStream.</returns>
        [[nodiscard]] int ReadByte();

        /// <returns>The number of bytes read, or EndOfStream. Only returns 0 for an empty buffer.</returns>
        [[nodiscard]] int64_t Read(std::span<char> buffer);

        void Close();

        // The stream only moves forward. Both always throw StreamMisuseException.
        [[noreturn]] void Skip(int64_t n);
        [[noreturn]] void Reset();

        const BlobLocator& GetLocator() const noexcept;
        const ByteRange& GetRange() const noexcept;
        StreamState GetState() const noexcept;
        int GetAttempt() const noexcept;
        int GetMaxRetries() const noexcept;

        // NOTE: Relative to the start of the range
        int64_t GetOffset() const noexcept;
        const FailureList& GetFailures() const noexcept;

    private:
        template <typename ReadOperation>
        int64_t ReadWithRetries(ReadOperation&& read);

        void EnsureOpen() const;
        void OpenSource();
        void ReopenOrFail(const StorageException& error);
        void CloseSourceWhileHandlingException();
        void AddSuppressedFailures(BlobStreamException& error) const;
    };
}
