// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/RocksDB/RangeSequentialFile.hpp"
#include "AVEVA/BlobStream/RocksDB/StreamErrorTranslator.hpp"

#include <cassert>
#include <span>
namespace AVEVA::BlobStream::RocksDB
{
    using namespace boost::log::trivial;

    RangeSequentialFile::RangeSequentialFile(std::unique_ptr<Core::RangeStream> stream,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_stream(std::move(stream)),
        m_logger(std::move(logger))
    {
    }

    rocksdb::IOStatus RangeSequentialFile::Read(const size_t n,
        const rocksdb::IOOptions&,
        rocksdb::Slice* result,
        char* scratch,
        rocksdb::IODebugContext*)
    {
        try
        {
            size_t totalRead = 0;
            while (totalRead < n)
            {
                const auto bytesRead = m_stream->Read(std::span<char>(scratch + totalRead, n - totalRead));
                if (bytesRead == Core::RangeStream::EndOfStream)
                {
                    break;
                }

                assert(bytesRead > 0 && "RangeStream::Read should not return 0 for a non-empty buffer");
                totalRead += static_cast<size_t>(bytesRead);
            }

            *result = rocksdb::Slice(scratch, totalRead);
            return rocksdb::IOStatus::OK();
        }
        catch (const Core::BlobStreamException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << ex.what() << " (" << ex.GetSuppressed().size() << " earlier failures)";
            return StreamErrorTranslator::IOStatusFromError(ex);
        }
        catch (const Core::StreamMisuseException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << ex.what();
            return StreamErrorTranslator::IOStatusFromError(ex);
        }
        catch (const std::exception& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << ex.what();
            return rocksdb::IOStatus::IOError(ex.what());
        }
    }

    rocksdb::IOStatus RangeSequentialFile::Skip(const uint64_t)
    {
        return rocksdb::IOStatus::NotSupported("RangeSequentialFile does not support seeking");
    }
}
