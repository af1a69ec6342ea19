// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Azure/AzureErrorTranslator.hpp"
#include "AVEVA/BlobStream/Core/FailureClassifier.hpp"

#include <gtest/gtest.h>
#include <azure/core/exception.hpp>
#include <azure/core/http/http_status_code.hpp>

#include <string>
using AVEVA::BlobStream::Azure::AzureErrorTranslator;
using AVEVA::BlobStream::Core::FailureClassifier;
using AVEVA::BlobStream::Core::FailureKind;
using AVEVA::BlobStream::Core::StorageException;
using Azure::Core::Http::HttpStatusCode;
using Azure::Core::RequestFailedException;

namespace
{
    RequestFailedException CreateError(const HttpStatusCode statusCode, const std::string& errorCode, const std::string& message)
    {
        RequestFailedException error(message);
        error.StatusCode = statusCode;
        error.ErrorCode = errorCode;
        error.Message = message;
        return error;
    }
}

TEST(AzureErrorTranslatorTests, StatusCodeFromError_MapsHttpStatus)
{
    EXPECT_EQ(StorageException::NoResponse, AzureErrorTranslator::StatusCodeFromError(HttpStatusCode::None));
    EXPECT_EQ(StorageException::NotFoundStatus, AzureErrorTranslator::StatusCodeFromError(HttpStatusCode::NotFound));
    EXPECT_EQ(503, AzureErrorTranslator::StatusCodeFromError(HttpStatusCode::ServiceUnavailable));
    EXPECT_EQ(500, AzureErrorTranslator::StatusCodeFromError(HttpStatusCode::InternalServerError));
}

TEST(AzureErrorTranslatorTests, StorageExceptionFromError_BlobNotFound_IsClassifiedNotFound)
{
    // Arrange
    const auto error = CreateError(HttpStatusCode::NotFound, "BlobNotFound", "The specified blob does not exist.");

    // Act
    const auto translated = AzureErrorTranslator::StorageExceptionFromError("Failed reading [data/000001.sst]", error);

    // Assert
    EXPECT_TRUE(translated.IsNotFound());
    EXPECT_EQ(FailureKind::NotFound, FailureClassifier::Classify(translated));
    EXPECT_EQ("Failed reading [data/000001.sst]: [BlobNotFound] (Status Code: 404) The specified blob does not exist.", std::string(translated.what()));
}

TEST(AzureErrorTranslatorTests, StorageExceptionFromError_ServerBusy_IsClassifiedRetryable)
{
    // Arrange
    const auto error = CreateError(HttpStatusCode::ServiceUnavailable, "ServerBusy", "The server is busy.");

    // Act
    const auto translated = AzureErrorTranslator::StorageExceptionFromError("context", error);

    // Assert
    EXPECT_EQ(503, translated.GetStatusCode());
    EXPECT_EQ(FailureKind::Retryable, FailureClassifier::Classify(translated));
}

TEST(AzureErrorTranslatorTests, StorageExceptionFromError_NoResponse_IsClassifiedRetryable)
{
    // Arrange
    const auto error = CreateError(HttpStatusCode::None, "", "Connection reset");

    // Act
    const auto translated = AzureErrorTranslator::StorageExceptionFromError("context", error);

    // Assert
    EXPECT_EQ(StorageException::NoResponse, translated.GetStatusCode());
    EXPECT_EQ(FailureKind::Retryable, FailureClassifier::Classify(translated));
    EXPECT_EQ("context: (Status Code: 0) Connection reset", std::string(translated.what()));
}
