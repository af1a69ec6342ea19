// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/ReadChannel.hpp"
#include <gmock/gmock.h>
namespace AVEVA::BlobStream::Core::Mocks
{
    class ReadChannelMock : public ReadChannel
    {
    public:
        MOCK_METHOD(void, Seek, (int64_t offset), (override));
        MOCK_METHOD(void, SetFetchChunkSize, (int64_t chunkSize), (noexcept, override));
        MOCK_METHOD(int64_t, Fetch, (std::span<char> buffer), (override));
        MOCK_METHOD(bool, IsOpen, (), (const, override));
        MOCK_METHOD(void, Close, (), (override));
    };
}
