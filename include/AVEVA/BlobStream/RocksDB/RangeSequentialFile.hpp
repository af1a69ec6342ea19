// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/RangeStream.hpp"

#include <boost/log/trivial.hpp>
#include <rocksdb/file_system.h>

#include <memory>
namespace AVEVA::BlobStream::RocksDB
{
    class RangeSequentialFile final : public rocksdb::FSSequentialFile
    {
        std::unique_ptr<Core::RangeStream> m_stream;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
    public:
        RangeSequentialFile(std::unique_ptr<Core::RangeStream> stream,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        // NOTE: Only comes back short at the end of the range
        virtual rocksdb::IOStatus Read(size_t n, const rocksdb::IOOptions& options, rocksdb::Slice* result, char* scratch, rocksdb::IODebugContext* dbg) override;
        virtual rocksdb::IOStatus Skip(uint64_t n) override;
    };
}
