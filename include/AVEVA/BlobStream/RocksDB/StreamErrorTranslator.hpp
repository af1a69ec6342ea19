// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/BlobStreamException.hpp"

#include <rocksdb/io_status.h>
namespace AVEVA::BlobStream::RocksDB
{
    struct StreamErrorTranslator
    {
        static rocksdb::IOStatus IOStatusFromError(const Core::BlobStreamException& error);
        static rocksdb::IOStatus IOStatusFromError(const Core::StreamMisuseException& error);
    };
}
