// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/RocksDB/StreamErrorTranslator.hpp"
namespace AVEVA::BlobStream::RocksDB
{
    rocksdb::IOStatus StreamErrorTranslator::IOStatusFromError(const Core::BlobStreamException& error)
    {
        using rocksdb::IOStatus;

        if (dynamic_cast<const Core::BlobNotFoundException*>(&error) != nullptr)
        {
            return IOStatus::NotFound(error.what());
        }

        // The stream has used up its attempts by now.
        auto status = IOStatus::IOError(error.what());
        status.SetRetryable(false);
        return status;
    }

    rocksdb::IOStatus StreamErrorTranslator::IOStatusFromError(const Core::StreamMisuseException& error)
    {
        return rocksdb::IOStatus::InvalidArgument(error.what());
    }
}
