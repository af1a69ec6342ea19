// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStream/Core/StorageException.hpp"

#include <azure/core/exception.hpp>
#include <azure/core/http/http_status_code.hpp>

#include <string>
namespace AVEVA::BlobStream::Azure
{
    struct AzureErrorTranslator
    {
        static int32_t StatusCodeFromError(const ::Azure::Core::Http::HttpStatusCode& statusCode);
        static Core::StorageException StorageExceptionFromError(const std::string& context, const ::Azure::Core::RequestFailedException& error);
    };
}
