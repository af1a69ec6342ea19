// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <exception>
#include <string_view>
namespace AVEVA::BlobStream::Core
{
    enum class FailureKind
    {
        NotFound,
        Retryable,
        Misuse
    };

    std::string_view ToString(FailureKind kind) noexcept;

    struct FailureClassifier
    {
        /// <summary>
        /// Decides what a range stream does with a failure.
        ///
        /// A missing blob is NotFound whether it arrives as a BlobNotFoundException or as a
        /// StorageException with a not found status. Every other StorageException is Retryable.
        /// Anything else is a programming error and classified as Misuse.
        /// </summary>
        static FailureKind Classify(const std::exception& error) noexcept;
    };
}
