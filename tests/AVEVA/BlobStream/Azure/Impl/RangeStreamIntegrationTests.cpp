// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "IntegrationTestHelpers.hpp"
#include "AVEVA/BlobStream/Azure/Impl/BlobReadChannel.hpp"
#include "AVEVA/BlobStream/Core/BlobContainerReader.hpp"
#include "AVEVA/BlobStream/Core/Configuration.hpp"

#include <gtest/gtest.h>

#include <random>
#include <vector>
using AVEVA::BlobStream::Azure::Impl::BlobReadChannel;
using AVEVA::BlobStream::Azure::Impl::Testing::AzureIntegrationTestBase;
using AVEVA::BlobStream::Core::BlobContainerReader;
using AVEVA::BlobStream::Core::BlobLocator;
using AVEVA::BlobStream::Core::BlobNotFoundException;
using AVEVA::BlobStream::Core::Configuration;
using AVEVA::BlobStream::Core::RangeStream;
using AVEVA::BlobStream::Core::ReadChannel;

namespace
{
    std::vector<char> GenerateRandomData(const size_t size)
    {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 255);

        std::vector<char> data(size);
        for (auto& byte : data)
        {
            byte = static_cast<char>(dis(gen));
        }

        return data;
    }

    std::vector<char> ReadToEnd(RangeStream& stream, const size_t bufferSize)
    {
        std::vector<char> result;
        std::vector<char> buffer(bufferSize);
        while (true)
        {
            const auto bytesRead = stream.Read(buffer);
            if (bytesRead == RangeStream::EndOfStream)
            {
                break;
            }

            result.insert(result.end(), buffer.begin(), buffer.begin() + bytesRead);
        }

        return result;
    }
}

class RangeStreamIntegrationTests : public AzureIntegrationTestBase
{
protected:
    std::string GetBlobNamePrefix() const override
    {
        return "test-range-stream";
    }

    BlobContainerReader CreateReader() const
    {
        return BlobContainerReader(CreateStoreClient(), m_credentials->ContainerName, m_logger);
    }
};

TEST_F(RangeStreamIntegrationTests, ReadBlob_WholeBlob_MatchesUpload)
{
    // Arrange
    const auto data = GenerateRandomData(5 * 1024 * 1024 + 123);
    UploadBlob(data);
    const auto reader = CreateReader();

    // Act
    const auto stream = reader.ReadBlob(m_blobName);
    const auto result = ReadToEnd(*stream, 256 * 1024);

    // Assert
    EXPECT_EQ(data, result);
    EXPECT_EQ(1, stream->GetAttempt());
}

TEST_F(RangeStreamIntegrationTests, ReadBlob_Range_ReturnsOnlyTheRange)
{
    // Arrange
    const auto data = GenerateRandomData(3 * 1024 * 1024);
    UploadBlob(data);
    const auto reader = CreateReader();

    // Act
    const auto stream = reader.ReadBlob(m_blobName, 1024 * 1024 + 7, 1000);
    const auto result = ReadToEnd(*stream, 4096);

    // Assert
    EXPECT_EQ(std::vector<char>(data.begin() + 1024 * 1024 + 7, data.begin() + 1024 * 1024 + 1007), result);
}

TEST_F(RangeStreamIntegrationTests, ReadBlob_RangePastEnd_StopsAtEndOfBlob)
{
    // Arrange
    const auto data = GenerateRandomData(1000);
    UploadBlob(data);
    const auto reader = CreateReader();

    // Act
    const auto stream = reader.ReadBlob(m_blobName, 900, 5000);
    const auto result = ReadToEnd(*stream, 4096);

    // Assert
    EXPECT_EQ(std::vector<char>(data.begin() + 900, data.end()), result);
}

TEST_F(RangeStreamIntegrationTests, ReadBlob_RangeStartsPastEnd_ReturnsEndOfStream)
{
    // Arrange
    UploadBlob(GenerateRandomData(100));
    const auto reader = CreateReader();
    const auto stream = reader.ReadBlob(m_blobName, 500, 10);
    std::vector<char> buffer(10);

    // Act
    const auto bytesRead = stream->Read(buffer);

    // Assert
    EXPECT_EQ(RangeStream::EndOfStream, bytesRead);
}

TEST_F(RangeStreamIntegrationTests, ReadBlob_MissingBlob_ThrowsBlobNotFound)
{
    // Arrange
    const auto reader = CreateReader();
    const auto stream = reader.ReadBlob(m_blobName);
    std::vector<char> buffer(10);

    // Act & Assert
    EXPECT_THROW([[maybe_unused]] const auto bytesRead = stream->Read(buffer), BlobNotFoundException);
    EXPECT_EQ(1, stream->GetAttempt());
}

TEST_F(RangeStreamIntegrationTests, BlobReadChannel_SmallChunk_BuffersExcess)
{
    // Arrange
    const auto data = GenerateRandomData(100);
    UploadBlob(data);
    BlobReadChannel channel(BlobLocator{ m_credentials->ContainerName, m_blobName },
        m_containerClient->GetBlobClient(m_blobName));
    channel.SetFetchChunkSize(60);
    std::vector<char> buffer(40);

    // Act
    const auto first = channel.Fetch(buffer);
    const auto second = channel.Fetch(buffer);
    const auto third = channel.Fetch(buffer);
    const auto fourth = channel.Fetch(buffer);

    // Assert
    EXPECT_EQ(40, first);
    EXPECT_EQ(20, second);
    EXPECT_EQ(40, third);
    EXPECT_EQ(ReadChannel::EndOfStream, fourth);
    channel.SetFetchChunkSize(Configuration::ReadChannel::UseDefaultChunkSize);
    EXPECT_EQ(Configuration::ReadChannel::DefaultChunkSize, channel.GetChunkSize());
}
