// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStream/Azure/AzureErrorTranslator.hpp"
namespace AVEVA::BlobStream::Azure
{
    int32_t AzureErrorTranslator::StatusCodeFromError(const ::Azure::Core::Http::HttpStatusCode& statusCode)
    {
        using ::Azure::Core::Http::HttpStatusCode;

        switch (statusCode)
        {
        case HttpStatusCode::None:
            return Core::StorageException::NoResponse;
        case HttpStatusCode::NotFound:
            return Core::StorageException::NotFoundStatus;
        default:
            return static_cast<int32_t>(statusCode);
        }
    }

    Core::StorageException AzureErrorTranslator::StorageExceptionFromError(const std::string& context, const ::Azure::Core::RequestFailedException& error)
    {
        const auto statusCode = StatusCodeFromError(error.StatusCode);
        std::string message = context + ": ";
        if (!error.ErrorCode.empty())
        {
            message += "[" + error.ErrorCode + "] ";
        }

        message += "(Status Code: " + std::to_string(statusCode) + ") " + (error.Message.empty() ? std::string(error.what()) : error.Message);
        return Core::StorageException{ statusCode, message };
    }
}
